#include "jpeg_codec.h"

#include <turbojpeg.h>

namespace pixscope {

static void set_err(std::string *err, const char *what, tjhandle h) {
  if (!err) return;
  *err = what;
  if (h) {
    *err += ": ";
    *err += tj3GetErrorStr(h);
  }
}

bool jpeg_encode_xrgb(const uint32_t *xrgb, int w, int h, int stride_bytes, int quality,
                      std::vector<uint8_t> &out_jpeg, std::string *err) {
  if (!xrgb || w <= 0 || h <= 0 || stride_bytes < w * 4) {
    if (err) *err = "invalid source raster";
    return false;
  }

  tjhandle compressor = tj3Init(TJINIT_COMPRESS);
  if (!compressor) {
    set_err(err, "tj3Init(compress) failed", nullptr);
    return false;
  }

  if (quality < 1) quality = 1;
  if (quality > 100) quality = 100;
  tj3Set(compressor, TJPARAM_QUALITY, quality);
  tj3Set(compressor, TJPARAM_SUBSAMP, TJSAMP_420);

  unsigned char *dest_buf = nullptr;
  size_t dest_size = 0;

  // XRGB8888 in little-endian memory order is B,G,R,X.
  int status = tj3Compress8(
    compressor,
    reinterpret_cast<const unsigned char*>(xrgb),
    w, stride_bytes, h,
    TJPF_BGRX,
    &dest_buf, &dest_size
  );

  if (status == 0) {
    out_jpeg.assign(dest_buf, dest_buf + dest_size);
  } else {
    set_err(err, "tj3Compress8 failed", compressor);
  }

  tj3Free(dest_buf);
  tj3Destroy(compressor);
  return (status == 0);
}

bool jpeg_decode_xrgb(const uint8_t *jpeg, size_t len, int max_w, int max_h,
                      std::vector<uint32_t> &out_xrgb, uint32_t &out_w, uint32_t &out_h,
                      std::string *err) {
  if (!jpeg || len == 0) {
    if (err) *err = "empty jpeg";
    return false;
  }

  tjhandle d = tj3Init(TJINIT_DECOMPRESS);
  if (!d) {
    set_err(err, "tj3Init(decompress) failed", nullptr);
    return false;
  }

  bool ok = false;
  if (tj3DecompressHeader(d, jpeg, len) != 0) {
    set_err(err, "tj3DecompressHeader failed", d);
  } else {
    int w = tj3Get(d, TJPARAM_JPEGWIDTH);
    int h = tj3Get(d, TJPARAM_JPEGHEIGHT);
    if (w <= 0 || h <= 0 || w > max_w || h > max_h) {
      if (err) *err = "jpeg size " + std::to_string(w) + "x" + std::to_string(h) + " out of range";
    } else {
      out_xrgb.resize((size_t)w * (size_t)h);
      if (tj3Decompress8(d, jpeg, len, reinterpret_cast<unsigned char*>(out_xrgb.data()),
                         w * 4, TJPF_BGRX) != 0) {
        set_err(err, "tj3Decompress8 failed", d);
      } else {
        // libjpeg-turbo leaves the X byte undefined.
        for (auto &p : out_xrgb) p |= 0xFF000000u;
        out_w = (uint32_t)w;
        out_h = (uint32_t)h;
        ok = true;
      }
    }
  }

  tj3Destroy(d);
  return ok;
}

}  // namespace pixscope
