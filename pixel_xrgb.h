#pragma once
#include <stdint.h>

// XRGB8888 pixel helpers shared by the frame buffer, the histogram scan and the renderer.

namespace pixscope {

static inline uint8_t clamp_u8(int v) { return (v < 0) ? 0 : (v > 255 ? 255 : (uint8_t)v); }

static inline uint32_t pack_xrgb8888(uint8_t r, uint8_t g, uint8_t b) {
  return 0xFF000000u | ((uint32_t)r<<16) | ((uint32_t)g<<8) | (uint32_t)b;
}

static inline uint8_t xrgb_r(uint32_t p) { return (uint8_t)((p >> 16) & 0xFF); }
static inline uint8_t xrgb_g(uint32_t p) { return (uint8_t)((p >> 8) & 0xFF); }
static inline uint8_t xrgb_b(uint32_t p) { return (uint8_t)(p & 0xFF); }

// Rec.709 luma weights, 0..255 scale.
static constexpr float kLumaWr = 0.2126f;
static constexpr float kLumaWg = 0.7152f;
static constexpr float kLumaWb = 0.0722f;

static inline float luma709(uint8_t r, uint8_t g, uint8_t b) {
  return kLumaWr * (float)r + kLumaWg * (float)g + kLumaWb * (float)b;
}

static inline uint32_t blend_over_xrgb(uint32_t under, uint32_t over, uint8_t a) {
  if (a==0) return under;
  if (a==255) return over;
  uint32_t ur=xrgb_r(under), ug=xrgb_g(under), ub=xrgb_b(under);
  uint32_t orr=xrgb_r(over), og=xrgb_g(over), ob=xrgb_b(over);
  uint32_t rr=(orr*a + ur*(255-a) + 127)/255;
  uint32_t gg=(og*a  + ug*(255-a) + 127)/255;
  uint32_t bb=(ob*a  + ub*(255-a) + 127)/255;
  return 0xFF000000u | (rr<<16) | (gg<<8) | bb;
}

// "Screen" composite: 1 - (1-under)(1-over*a), per channel.
static inline uint32_t blend_screen_xrgb(uint32_t under, uint32_t over, uint8_t a) {
  if (a==0) return under;
  uint32_t ur=xrgb_r(under), ug=xrgb_g(under), ub=xrgb_b(under);
  uint32_t orr=(xrgb_r(over)*a + 127)/255;
  uint32_t og=(xrgb_g(over)*a + 127)/255;
  uint32_t ob=(xrgb_b(over)*a + 127)/255;
  uint32_t rr=ur + orr - (ur*orr + 127)/255;
  uint32_t gg=ug + og  - (ug*og  + 127)/255;
  uint32_t bb=ub + ob  - (ub*ob  + 127)/255;
  return 0xFF000000u | (rr<<16) | (gg<<8) | bb;
}

}  // namespace pixscope
