#include "jpeg_thumbnail.h"

#include <turbojpeg.h>

bool downscale_rgb(const std::vector<uint8_t> &src, int w, int h, int ratio,
                   std::vector<uint8_t> &out, int *out_w, int *out_h) {
    if (ratio < 1 || w <= 0 || h <= 0) return false;
    if (src.size() < (size_t)w * h * 3) return false;
    int ow = w / ratio, oh = h / ratio;
    if (ow == 0 || oh == 0) return false;

    out.resize((size_t)ow * oh * 3);
    const uint32_t area = (uint32_t)ratio * ratio;
    for (int y = 0; y < oh; y++) {
        for (int x = 0; x < ow; x++) {
            uint32_t acc[3] = {0, 0, 0};
            for (int dy = 0; dy < ratio; dy++) {
                const uint8_t *row = &src[((size_t)(y * ratio + dy) * w + (size_t)x * ratio) * 3];
                for (int dx = 0; dx < ratio; dx++) {
                    acc[0] += row[dx * 3 + 0];
                    acc[1] += row[dx * 3 + 1];
                    acc[2] += row[dx * 3 + 2];
                }
            }
            uint8_t *px = &out[((size_t)y * ow + x) * 3];
            px[0] = (uint8_t)(acc[0] / area);
            px[1] = (uint8_t)(acc[1] / area);
            px[2] = (uint8_t)(acc[2] / area);
        }
    }
    *out_w = ow;
    *out_h = oh;
    return true;
}

bool encode_rgb_to_jpeg(const uint8_t *rgb, int w, int h, int quality, std::vector<uint8_t> &out_jpeg) {
    if (!rgb) return false;

    tjhandle compressor = tj3Init(TJINIT_COMPRESS);
    if (!compressor) return false;

    tj3Set(compressor, TJPARAM_QUALITY, quality);
    tj3Set(compressor, TJPARAM_SUBSAMP, TJSAMP_420);

    unsigned char* dest_buf = nullptr;
    size_t dest_size = 0;

    int status = tj3Compress8(
        compressor,
        rgb,
        w, w * 3, h,
        TJPF_RGB,
        &dest_buf, &dest_size
    );

    if (status == 0) {
        out_jpeg.assign(dest_buf, dest_buf + dest_size);
    }

    tj3Free(dest_buf);
    tj3Destroy(compressor);
    return (status == 0);
}
