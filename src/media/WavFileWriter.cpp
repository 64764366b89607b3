// Repository: PeerLink
// Component: WavFileWriter
// Purpose: Audio playback output writing decoded S16 PCM to a WAV file.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/WavFileWriter.hpp"

#include <cstring>
#include <utility>

#include "peerlink/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
}

namespace peerlink::media {

using util::Logger;

namespace {

std::string AvError(const char* what, int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return std::string(what) + ": " + errbuf;
}

}  // namespace

WavFileWriter::WavFileWriter(std::string path, const config::MediaConfig& media)
    : path_(std::move(path)), media_(media) {}

WavFileWriter::~WavFileWriter() {
  Finish();
}

void WavFileWriter::Release() {
  if (packet_) av_packet_free(&packet_);
  if (format_ctx_) {
    if (format_ctx_->pb && !(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
      avio_closep(&format_ctx_->pb);
    }
    avformat_free_context(format_ctx_);
    format_ctx_ = nullptr;
  }
  stream_ = nullptr;
  header_written_ = false;
}

bool WavFileWriter::Open(std::string* error) {
  Release();

  int ret = avformat_alloc_output_context2(&format_ctx_, nullptr, "wav", path_.c_str());
  if (ret < 0 || !format_ctx_) {
    *error = AvError("avformat_alloc_output_context2(wav)", ret);
    return false;
  }

  stream_ = avformat_new_stream(format_ctx_, nullptr);
  if (!stream_) {
    *error = "failed to create WAV stream";
    Release();
    return false;
  }
  AVCodecParameters* par = stream_->codecpar;
  par->codec_type = AVMEDIA_TYPE_AUDIO;
  par->codec_id = AV_CODEC_ID_PCM_S16LE;
  par->format = AV_SAMPLE_FMT_S16;
  par->sample_rate = media_.sample_rate;
  av_channel_layout_default(&par->ch_layout, media_.channels);
  par->bits_per_coded_sample = 16;
  par->block_align = media_.channels * 2;
  par->bit_rate = static_cast<int64_t>(media_.sample_rate) * media_.channels * 16;
  stream_->time_base.num = 1;
  stream_->time_base.den = media_.sample_rate;

  if (!(format_ctx_->oformat->flags & AVFMT_NOFILE)) {
    ret = avio_open(&format_ctx_->pb, path_.c_str(), AVIO_FLAG_WRITE);
    if (ret < 0) {
      *error = AvError(("avio_open(" + path_ + ")").c_str(), ret);
      Release();
      return false;
    }
  }

  ret = avformat_write_header(format_ctx_, nullptr);
  if (ret < 0) {
    *error = AvError("avformat_write_header", ret);
    Release();
    return false;
  }
  header_written_ = true;

  packet_ = av_packet_alloc();
  if (!packet_) {
    *error = "failed to allocate packet";
    Release();
    return false;
  }

  Logger::Info("[WavFileWriter] OPEN path=" + path_ +
               " rate=" + std::to_string(media_.sample_rate) +
               " channels=" + std::to_string(media_.channels));
  return true;
}

bool WavFileWriter::Consume(const core::Frame& frame, std::string* error) {
  if (!header_written_) {
    *error = "WAV writer not open";
    return false;
  }
  const int bytes_per_sample = media_.channels * 2;
  const int64_t samples = static_cast<int64_t>(frame.size()) / bytes_per_sample;
  if (samples == 0) return true;

  int ret = av_new_packet(packet_, static_cast<int>(samples * bytes_per_sample));
  if (ret < 0) {
    *error = AvError("av_new_packet", ret);
    return false;
  }
  std::memcpy(packet_->data, frame.data.data(), static_cast<size_t>(packet_->size));
  packet_->stream_index = stream_->index;
  packet_->pts = next_pts_;
  packet_->dts = next_pts_;
  packet_->duration = samples;
  next_pts_ += samples;

  ret = av_interleaved_write_frame(format_ctx_, packet_);
  if (ret < 0) {
    *error = AvError("av_interleaved_write_frame", ret);
    return false;
  }
  return true;
}

void WavFileWriter::Finish() {
  if (header_written_) {
    const int ret = av_write_trailer(format_ctx_);
    if (ret < 0) {
      Logger::Warn("[WavFileWriter] " + AvError("av_write_trailer", ret));
    }
    Logger::Info("[WavFileWriter] CLOSE path=" + path_ +
                 " samples=" + std::to_string(next_pts_));
  }
  Release();
}

}  // namespace peerlink::media
