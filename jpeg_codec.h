#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace pixscope {

// XRGB8888 (tight or strided) -> baseline JPEG, 4:2:0.
bool jpeg_encode_xrgb(const uint32_t *xrgb, int w, int h, int stride_bytes, int quality,
                      std::vector<uint8_t> &out_jpeg, std::string *err);

// JPEG -> tight XRGB8888. Rejects images larger than max_w x max_h.
bool jpeg_decode_xrgb(const uint8_t *jpeg, size_t len, int max_w, int max_h,
                      std::vector<uint32_t> &out_xrgb, uint32_t &out_w, uint32_t &out_h,
                      std::string *err);

}  // namespace pixscope
