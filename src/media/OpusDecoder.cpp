// Repository: PeerLink
// Component: OpusDecoder
// Purpose: Opus packets -> interleaved S16 PCM over libavcodec.
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

}  // namespace

OpusDecoder::OpusDecoder(const config::MediaConfig& media) : media_(media) {}

OpusDecoder::~OpusDecoder() {
  Release();
}

void OpusDecoder::Release() {
  if (swr_ctx_) swr_free(&swr_ctx_);
  if (packet_) av_packet_free(&packet_);
  if (frame_) av_frame_free(&frame_);
  if (codec_ctx_) avcodec_free_context(&codec_ctx_);
}

bool OpusDecoder::Open(std::string* error) {
  Release();

  const AVCodec* codec = avcodec_find_decoder_by_name("libopus");
  if (!codec) {
    codec = avcodec_find_decoder(AV_CODEC_ID_OPUS);
  }
  if (!codec) {
    *error = "no Opus decoder available in libavcodec";
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    *error = "failed to allocate Opus decoder context";
    return false;
  }
  codec_ctx_->sample_rate = media_.sample_rate;
  av_channel_layout_default(&codec_ctx_->ch_layout, media_.channels);
  codec_ctx_->request_sample_fmt = AV_SAMPLE_FMT_S16;

  const int ret = avcodec_open2(codec_ctx_, codec, nullptr);
  if (ret < 0) {
    *error = AvError("avcodec_open2(opus decoder)", ret);
    Release();
    return false;
  }

  frame_ = av_frame_alloc();
  packet_ = av_packet_alloc();
  if (!frame_ || !packet_) {
    *error = "failed to allocate decoder frame/packet";
    Release();
    return false;
  }

  Logger::Info(std::string("[OpusDecoder] OPEN codec=") + codec->name +
               " rate=" + std::to_string(media_.sample_rate) +
               " channels=" + std::to_string(media_.channels));
  return true;
}

bool OpusDecoder::Decode(const core::Frame& packet, std::vector<int16_t>* samples,
                         std::string* error) {
  if (!codec_ctx_) {
    *error = "decoder not open";
    return false;
  }
  if (packet.empty()) {
    *error = "empty audio packet";
    return false;
  }

  int ret = av_new_packet(packet_, static_cast<int>(packet.size()));
  if (ret < 0) {
    *error = AvError("av_new_packet", ret);
    return false;
  }
  std::memcpy(packet_->data, packet.data.data(), packet.size());

  ret = avcodec_send_packet(codec_ctx_, packet_);
  av_packet_unref(packet_);
  if (ret < 0) {
    *error = AvError("avcodec_send_packet", ret);
    return false;
  }

  while (true) {
    ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == AVERROR(EAGAIN) || ret == AVERROR_EOF) {
      return true;
    }
    if (ret < 0) {
      *error = AvError("avcodec_receive_frame", ret);
      return false;
    }
    const bool converted = ConvertFrame(samples, error);
    av_frame_unref(frame_);
    if (!converted) return false;
  }
}

bool OpusDecoder::ConvertFrame(std::vector<int16_t>* samples, std::string* error) {
  if (!swr_ctx_) {
    AVChannelLayout out_layout;
    av_channel_layout_default(&out_layout, media_.channels);
    int ret = swr_alloc_set_opts2(&swr_ctx_,
                                  &out_layout, AV_SAMPLE_FMT_S16, media_.sample_rate,
                                  &frame_->ch_layout,
                                  static_cast<AVSampleFormat>(frame_->format),
                                  frame_->sample_rate,
                                  0, nullptr);
    av_channel_layout_uninit(&out_layout);
    if (ret < 0 || swr_init(swr_ctx_) < 0) {
      *error = "failed to initialize decoder -> S16 resampler";
      if (swr_ctx_) swr_free(&swr_ctx_);
      return false;
    }
  }

  const int out_capacity = swr_get_out_samples(swr_ctx_, frame_->nb_samples);
  if (out_capacity < 0) {
    *error = AvError("swr_get_out_samples", out_capacity);
    return false;
  }
  const size_t base = samples->size();
  samples->resize(base + static_cast<size_t>(out_capacity) * media_.channels);
  uint8_t* out[1] = {reinterpret_cast<uint8_t*>(samples->data() + base)};
  const int produced = swr_convert(swr_ctx_, out, out_capacity,
                                   const_cast<const uint8_t**>(frame_->extended_data),
                                   frame_->nb_samples);
  if (produced < 0) {
    samples->resize(base);
    *error = AvError("swr_convert", produced);
    return false;
  }
  samples->resize(base + static_cast<size_t>(produced) * media_.channels);
  return true;
}

}  // namespace peerlink::media
