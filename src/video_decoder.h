#pragma once

#include <filesystem>

#include "image_data.h"

// True when the build links FFmpeg; otherwise decode_first_video_frame always throws
bool video_decoding_available();

// Decodes the first readable frame of a video into RGBA pixels (OnDestroy::FREE).
// Throws ThumbnailGenerationException if the container or codec cannot be read.
ImageData decode_first_video_frame(const std::filesystem::path& video_path);
