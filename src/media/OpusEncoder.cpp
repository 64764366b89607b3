// Repository: PeerLink
// Component: OpusEncoder
// Purpose: S16 PCM -> Opus packets over libavcodec.
// Copyright (c) 2026 PeerLink

#include "peerlink/media/AudioCodec.hpp"

#include <cstring>

#include "peerlink/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

namespace peerlink::media {

using util::Logger;

namespace {

std::string AvError(const char* what, int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, AV_ERROR_MAX_STRING_SIZE);
  return std::string(what) + ": " + errbuf;
}

bool SupportsS16(const AVCodec* codec) {
  if (!codec->sample_fmts) return false;
  for (const AVSampleFormat* fmt = codec->sample_fmts; *fmt != AV_SAMPLE_FMT_NONE; ++fmt) {
    if (*fmt == AV_SAMPLE_FMT_S16) return true;
  }
  return false;
}

}  // namespace

core::Frame PackS16(const std::vector<int16_t>& samples) {
  std::vector<uint8_t> bytes(samples.size() * 2);
  for (size_t i = 0; i < samples.size(); ++i) {
    const uint16_t v = static_cast<uint16_t>(samples[i]);
    bytes[2 * i] = static_cast<uint8_t>(v & 0xFF);
    bytes[2 * i + 1] = static_cast<uint8_t>(v >> 8);
  }
  return core::Frame(std::move(bytes));
}

std::vector<int16_t> UnpackS16(const core::Frame& frame) {
  std::vector<int16_t> samples(frame.size() / 2);
  for (size_t i = 0; i < samples.size(); ++i) {
    const uint16_t v = static_cast<uint16_t>(frame.data[2 * i]) |
                       static_cast<uint16_t>(frame.data[2 * i + 1] << 8);
    samples[i] = static_cast<int16_t>(v);
  }
  return samples;
}

OpusEncoder::OpusEncoder(const config::MediaConfig& media) : media_(media) {}

OpusEncoder::~OpusEncoder() {
  Release();
}

void OpusEncoder::Release() {
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
}

bool OpusEncoder::Open(std::string* error) {
  Release();

  const AVCodec* codec = avcodec_find_encoder_by_name("libopus");
  if (!codec) {
    // Native encoder as fallback
    codec = avcodec_find_encoder(AV_CODEC_ID_OPUS);
  }
  if (!codec) {
    *error = "no Opus encoder available in libavcodec";
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    *error = "failed to allocate Opus encoder context";
    return false;
  }
  const bool s16 = SupportsS16(codec);
  codec_ctx_->sample_fmt = s16 ? AV_SAMPLE_FMT_S16
                               : (codec->sample_fmts ? codec->sample_fmts[0] : AV_SAMPLE_FMT_FLTP);
  codec_ctx_->sample_rate = media_.sample_rate;
  av_channel_layout_default(&codec_ctx_->ch_layout, media_.channels);
  codec_ctx_->bit_rate = media_.opus_bitrate;
  codec_ctx_->time_base.num = 1;
  codec_ctx_->time_base.den = media_.sample_rate;
  codec_ctx_->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;

  int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    *error = AvError("avcodec_open2(opus encoder)", ret);
    Release();
    return false;
  }
  frame_size_ = codec_ctx_->frame_size > 0 ? codec_ctx_->frame_size : media_.frame_samples;

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    *error = "failed to allocate encoder frame/packet";
    Release();
    return false;
  }
  frame_->format = codec_ctx_->sample_fmt;
  frame_->sample_rate = codec_ctx_->sample_rate;
  frame_->nb_samples = frame_size_;
  av_channel_layout_copy(&frame_->ch_layout, &codec_ctx_->ch_layout);
  ret = av_frame_get_buffer(frame_, 0);
  if (ret < 0) {
    *error = AvError("av_frame_get_buffer", ret);
    Release();
    return false;
  }

  if (!s16) {
    ret = swr_alloc_set_opts2(&swr_ctx_,
                              &codec_ctx_->ch_layout, codec_ctx_->sample_fmt, media_.sample_rate,
                              &codec_ctx_->ch_layout, AV_SAMPLE_FMT_S16, media_.sample_rate,
                              0, nullptr);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
      *error = "failed to initialize S16 -> encoder format resampler";
      Release();
      return false;
    }
  }

  Logger::Info(std::string("[OpusEncoder] OPEN codec=") + codec->name +
               " rate=" + std::to_string(media_.sample_rate) +
               " channels=" + std::to_string(media_.channels) +
               " frame_size=" + std::to_string(frame_size_) +
               " bitrate=" + std::to_string(media_.opus_bitrate));
  return true;
}

bool OpusEncoder::Encode(const std::vector<int16_t>& interleaved,
                         std::vector<core::Frame>* packets, std::string* error) {
  if (!codec_ctx_) {
    *error = "encoder not open";
    return false;
  }
  pending_.insert(pending_.end(), interleaved.begin(), interleaved.end());

  const size_t chunk = static_cast<size_t>(frame_size_) * static_cast<size_t>(media_.channels);
  size_t offset = 0;
  bool ok = true;
  while (ok && pending_.size() - offset >= chunk) {
    ok = EncodeOneFrame(pending_.data() + offset, packets, error);
    offset += chunk;
  }
  pending_.erase(pending_.begin(), pending_.begin() + static_cast<std::ptrdiff_t>(offset));
  return ok;
}

bool OpusEncoder::EncodeOneFrame(const int16_t* samples, std::vector<core::Frame>* packets,
                                 std::string* error) {
  int ret = av_frame_make_writable(frame_);
  if (ret < 0) {
    *error = AvError("av_frame_make_writable", ret);
    return false;
  }
  frame_->nb_samples = frame_size_;

  if (swr_ctx_) {
    const uint8_t* in[1] = {reinterpret_cast<const uint8_t*>(samples)};
    ret = swr_convert(swr_ctx_, frame_->data, frame_size_, in, frame_size_);
    if (ret < 0) {
      *error = AvError("swr_convert", ret);
      return false;
    }
  } else {
    std::memcpy(frame_->data[0], samples,
                static_cast<size_t>(frame_size_) * media_.channels * sizeof(int16_t));
  }

  frame_->pts = next_pts_;
  next_pts_ += frame_size_;

  ret = avcodec_send_frame(codec_ctx_, frame_);
  if (ret < 0) {
    *error = AvError("avcodec_send_frame", ret);
    return false;
  }
  return Drain(packets, error);
}

bool OpusEncoder::Drain(std::vector<core::Frame>* packets, std::string* error) {
  while (true) {
    const int ret = avcodec_receive_packet(codec_ctx_, packet_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      *error = AvError("avcodec_receive_packet", ret);
      return false;
    }
    packets->emplace_back(std::vector<uint8_t>(packet_->data, packet_->data + packet_->size));
    av_packet_unref(packet_);
  }
}

}  // namespace peerlink::media
