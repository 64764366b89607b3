// Repository: PeerLink
// Component: Audio Codec
// Purpose: Opus encode/decode over libavcodec for the audio streams.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_AUDIO_CODEC_HPP_
#define PEERLINK_MEDIA_AUDIO_CODEC_HPP_

#include <cstdint>
#include <string>
#include <vector>

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/core/Frame.hpp"

// Forward declarations for FFmpeg types (avoid pulling FFmpeg into headers)
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwrContext;

namespace peerlink::media {

// Encoder seam used by the tone capture backend.
class IAudioEncoder {
 public:
  virtual ~IAudioEncoder() = default;

  // Consumes interleaved S16 samples and appends every packet the codec
  // emitted. Returns false with *error set on a codec failure.
  virtual bool Encode(const std::vector<int16_t>& interleaved,
                      std::vector<core::Frame>* packets, std::string* error) = 0;
};

// Decoder seam used by the audio ingress sink. One call per packet.
class IAudioDecoder {
 public:
  virtual ~IAudioDecoder() = default;

  // Appends interleaved S16 samples at the configured rate/channels.
  virtual bool Decode(const core::Frame& packet, std::vector<int16_t>* samples,
                      std::string* error) = 0;
};

// OpusEncoder prefers libopus and falls back to FFmpeg's native Opus encoder.
// Input of any length is buffered and cut into codec-sized frames.
class OpusEncoder : public IAudioEncoder {
 public:
  explicit OpusEncoder(const config::MediaConfig& media);
  ~OpusEncoder() override;

  OpusEncoder(const OpusEncoder&) = delete;
  OpusEncoder& operator=(const OpusEncoder&) = delete;

  // Must succeed before Encode(). Returns false with *error set otherwise.
  bool Open(std::string* error);

  bool Encode(const std::vector<int16_t>& interleaved, std::vector<core::Frame>* packets,
              std::string* error) override;

  // Samples per channel the codec consumes per packet (valid after Open()).
  int frame_size() const { return frame_size_; }

 private:
  bool EncodeOneFrame(const int16_t* samples, std::vector<core::Frame>* packets,
                      std::string* error);
  bool Drain(std::vector<core::Frame>* packets, std::string* error);
  void Release();

  config::MediaConfig media_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;  // Only when the codec does not take S16
  int frame_size_ = 0;
  int64_t next_pts_ = 0;
  std::vector<int16_t> pending_;
};

class OpusDecoder : public IAudioDecoder {
 public:
  explicit OpusDecoder(const config::MediaConfig& media);
  ~OpusDecoder() override;

  OpusDecoder(const OpusDecoder&) = delete;
  OpusDecoder& operator=(const OpusDecoder&) = delete;

  bool Open(std::string* error);

  bool Decode(const core::Frame& packet, std::vector<int16_t>* samples,
              std::string* error) override;

 private:
  bool ConvertFrame(std::vector<int16_t>* samples, std::string* error);
  void Release();

  config::MediaConfig media_;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwrContext* swr_ctx_ = nullptr;  // Created on the first decoded frame
};

// Interleaved S16 <-> little-endian byte frames.
core::Frame PackS16(const std::vector<int16_t>& samples);
std::vector<int16_t> UnpackS16(const core::Frame& frame);

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_AUDIO_CODEC_HPP_
