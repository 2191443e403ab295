#pragma once
#include <stdint.h>
#include <vector>

// Box-averages an RGB888 image by ratio in both directions.
// Output is (w / ratio) x (h / ratio); ratio 1 copies.
bool downscale_rgb(const std::vector<uint8_t> &src, int w, int h, int ratio,
                   std::vector<uint8_t> &out, int *out_w, int *out_h);

// Encodes a tightly packed RGB888 image.
bool encode_rgb_to_jpeg(const uint8_t *rgb, int w, int h, int quality, std::vector<uint8_t> &out_jpeg);
