// Repository: PeerLink
// Component: WavFileWriter
// Purpose: Audio playback output writing decoded S16 PCM to a WAV file.
// Copyright (c) 2026 PeerLink

#ifndef PEERLINK_MEDIA_WAV_FILE_WRITER_HPP_
#define PEERLINK_MEDIA_WAV_FILE_WRITER_HPP_

#include <cstdint>
#include <string>

#include "peerlink/config/SessionConfig.hpp"
#include "peerlink/media/PlaybackWorker.hpp"

// Forward declarations for FFmpeg types
struct AVFormatContext;
struct AVStream;
struct AVPacket;

namespace peerlink::media {

// Frames are little-endian interleaved S16 at the configured rate/channels.
// The WAV header is finalized in Finish() (or the destructor).
class WavFileWriter : public IFrameConsumer {
 public:
  WavFileWriter(std::string path, const config::MediaConfig& media);
  ~WavFileWriter() override;

  WavFileWriter(const WavFileWriter&) = delete;
  WavFileWriter& operator=(const WavFileWriter&) = delete;

  bool Open(std::string* error);

  bool Consume(const core::Frame& frame, std::string* error) override;
  void Finish() override;

  int64_t samples_written() const { return next_pts_; }

 private:
  void Release();

  std::string path_;
  config::MediaConfig media_;
  AVFormatContext* format_ctx_ = nullptr;
  AVStream* stream_ = nullptr;
  AVPacket* packet_ = nullptr;
  bool header_written_ = false;
  int64_t next_pts_ = 0;
};

}  // namespace peerlink::media

#endif  // PEERLINK_MEDIA_WAV_FILE_WRITER_HPP_
