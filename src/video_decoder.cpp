#include "video_decoder.h"

#include <cstdlib>
#include <cstring>

#include "logger.h"

#ifdef HAVE_FFMPEG
extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/imgutils.h>
#include <libswscale/swscale.h>
}
#endif

#ifdef HAVE_FFMPEG

namespace {
// Owns the FFmpeg objects of one decode so every exit path releases them
struct DecodeContext {
  AVFormatContext* format = nullptr;
  AVCodecContext* codec = nullptr;
  AVPacket* packet = nullptr;
  AVFrame* frame = nullptr;
  SwsContext* scaler = nullptr;

  ~DecodeContext() {
    if (scaler) sws_freeContext(scaler);
    if (frame) av_frame_free(&frame);
    if (packet) av_packet_free(&packet);
    if (codec) avcodec_free_context(&codec);
    if (format) avformat_close_input(&format);
  }
};

std::string av_error_string(int error) {
  char buffer[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(error, buffer, sizeof(buffer));
  return std::string(buffer);
}

ImageData convert_frame_to_rgba(DecodeContext& ctx) {
  const int width = ctx.frame->width;
  const int height = ctx.frame->height;
  if (width <= 0 || height <= 0) {
    throw ThumbnailGenerationException("Decoded video frame has no size");
  }

  ctx.scaler = sws_getContext(width, height, static_cast<AVPixelFormat>(ctx.frame->format),
    width, height, AV_PIX_FMT_RGBA, SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!ctx.scaler) {
    throw ThumbnailGenerationException("Failed to create pixel format converter");
  }

  ImageData image;
  image.width = width;
  image.height = height;
  image.channels = 4;
  image.on_destroy = OnDestroy::FREE;
  image.data = static_cast<unsigned char*>(std::malloc(static_cast<size_t>(width) * height * 4));
  if (!image.data) {
    throw ThumbnailGenerationException("Out of memory converting video frame");
  }

  uint8_t* destination[4] = {image.data, nullptr, nullptr, nullptr};
  int destination_stride[4] = {width * 4, 0, 0, 0};
  sws_scale(ctx.scaler, ctx.frame->data, ctx.frame->linesize, 0, height, destination, destination_stride);
  return image;
}
}

bool video_decoding_available() {
  return true;
}

ImageData decode_first_video_frame(const std::filesystem::path& video_path) {
  DecodeContext ctx;
  const std::string path = video_path.u8string();

  int result = avformat_open_input(&ctx.format, path.c_str(), nullptr, nullptr);
  if (result < 0) {
    throw ThumbnailGenerationException("Failed to open video " + path + ": " + av_error_string(result));
  }

  result = avformat_find_stream_info(ctx.format, nullptr);
  if (result < 0) {
    throw ThumbnailGenerationException("Failed to read stream info of " + path + ": " + av_error_string(result));
  }

  const AVCodec* decoder = nullptr;
  int stream_index = av_find_best_stream(ctx.format, AVMEDIA_TYPE_VIDEO, -1, -1, &decoder, 0);
  if (stream_index < 0 || !decoder) {
    throw ThumbnailGenerationException("No decodable video stream in " + path);
  }

  ctx.codec = avcodec_alloc_context3(decoder);
  if (!ctx.codec) {
    throw ThumbnailGenerationException("Failed to allocate decoder context");
  }
  result = avcodec_parameters_to_context(ctx.codec, ctx.format->streams[stream_index]->codecpar);
  if (result < 0) {
    throw ThumbnailGenerationException("Failed to configure decoder: " + av_error_string(result));
  }
  result = avcodec_open2(ctx.codec, decoder, nullptr);
  if (result < 0) {
    throw ThumbnailGenerationException("Failed to open decoder: " + av_error_string(result));
  }

  ctx.packet = av_packet_alloc();
  ctx.frame = av_frame_alloc();
  if (!ctx.packet || !ctx.frame) {
    throw ThumbnailGenerationException("Failed to allocate packet or frame");
  }

  while (av_read_frame(ctx.format, ctx.packet) >= 0) {
    if (ctx.packet->stream_index != stream_index) {
      av_packet_unref(ctx.packet);
      continue;
    }

    result = avcodec_send_packet(ctx.codec, ctx.packet);
    av_packet_unref(ctx.packet);
    if (result < 0) {
      // Damaged packet, keep looking for a readable frame
      LOG_DEBUG("[VIDEO] Skipping undecodable packet in {}: {}", path, av_error_string(result));
      continue;
    }

    result = avcodec_receive_frame(ctx.codec, ctx.frame);
    if (result == 0) {
      return convert_frame_to_rgba(ctx);
    }
    if (result != AVERROR(EAGAIN)) {
      LOG_DEBUG("[VIDEO] Decoder rejected frame in {}: {}", path, av_error_string(result));
    }
  }

  // Drain frames buffered inside the decoder
  if (avcodec_send_packet(ctx.codec, nullptr) >= 0 && avcodec_receive_frame(ctx.codec, ctx.frame) == 0) {
    return convert_frame_to_rgba(ctx);
  }

  throw ThumbnailGenerationException("No readable frame in " + path);
}

#else

bool video_decoding_available() {
  return false;
}

ImageData decode_first_video_frame(const std::filesystem::path& video_path) {
  throw ThumbnailGenerationException("Video decoding is not available in this build: " + video_path.u8string());
}

#endif
