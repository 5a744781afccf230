#include "ffmpeg-audio.h"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/channel_layout.h>
#include <libavutil/error.h>
#include <libavutil/mem.h>
#include <libavutil/samplefmt.h>
#include <libswresample/swresample.h>
}

#include <algorithm>
#include <cstdio>
#include <cstring>

namespace {

constexpr int k_io_buffer_size = 64 * 1024;

std::string av_err_str(int code) {
    char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
    av_strerror(code, buf, sizeof(buf));
    return std::string(buf);
}

struct memory_reader {
    const uint8_t * data = nullptr;
    size_t size = 0;
    size_t pos = 0;
};

int memory_read(void * opaque, uint8_t * buf, int buf_size) {
    auto * r = static_cast<memory_reader *>(opaque);
    const size_t remaining = r->size - r->pos;
    const size_t n = std::min(remaining, (size_t) buf_size);
    if (n == 0) {
        return AVERROR_EOF;
    }
    std::memcpy(buf, r->data + r->pos, n);
    r->pos += n;
    return (int) n;
}

int64_t memory_read_seek(void * opaque, int64_t offset, int whence) {
    auto * r = static_cast<memory_reader *>(opaque);
    whence &= ~AVSEEK_FORCE;
    int64_t target = 0;
    switch (whence) {
        case AVSEEK_SIZE: return (int64_t) r->size;
        case SEEK_SET:    target = offset; break;
        case SEEK_CUR:    target = (int64_t) r->pos + offset; break;
        case SEEK_END:    target = (int64_t) r->size + offset; break;
        default:          return -1;
    }
    if (target < 0) {
        return -1;
    }
    r->pos = std::min((size_t) target, r->size);
    return (int64_t) r->pos;
}

struct memory_writer {
    std::vector<uint8_t> * out = nullptr;
    size_t pos = 0;
};

#if LIBAVFORMAT_VERSION_MAJOR >= 61
int memory_write(void * opaque, const uint8_t * buf, int buf_size) {
#else
int memory_write(void * opaque, uint8_t * buf, int buf_size) {
#endif
    auto * w = static_cast<memory_writer *>(opaque);
    if (buf_size <= 0) {
        return 0;
    }
    if (w->pos + (size_t) buf_size > w->out->size()) {
        w->out->resize(w->pos + (size_t) buf_size);
    }
    std::memcpy(w->out->data() + w->pos, buf, (size_t) buf_size);
    w->pos += (size_t) buf_size;
    return buf_size;
}

int64_t memory_write_seek(void * opaque, int64_t offset, int whence) {
    auto * w = static_cast<memory_writer *>(opaque);
    whence &= ~AVSEEK_FORCE;
    int64_t target = 0;
    switch (whence) {
        case AVSEEK_SIZE: return (int64_t) w->out->size();
        case SEEK_SET:    target = offset; break;
        case SEEK_CUR:    target = (int64_t) w->pos + offset; break;
        case SEEK_END:    target = (int64_t) w->out->size() + offset; break;
        default:          return -1;
    }
    if (target < 0) {
        return -1;
    }
    w->pos = (size_t) target;
    return target;
}

struct io_context_guard {
    AVIOContext *& ctx;
    ~io_context_guard() {
        if (ctx != nullptr) {
            av_freep(&ctx->buffer);
            avio_context_free(&ctx);
        }
    }
};

struct input_context_guard {
    AVFormatContext *& ctx;
    ~input_context_guard() {
        if (ctx != nullptr) {
            avformat_close_input(&ctx);
        }
    }
};

struct output_context_guard {
    AVFormatContext *& ctx;
    ~output_context_guard() {
        if (ctx != nullptr) {
            avformat_free_context(ctx);
            ctx = nullptr;
        }
    }
};

struct codec_context_guard {
    AVCodecContext *& ctx;
    ~codec_context_guard() {
        if (ctx != nullptr) {
            avcodec_free_context(&ctx);
        }
    }
};

struct frame_packet_guard {
    AVFrame *& frame;
    AVPacket *& packet;
    ~frame_packet_guard() {
        if (frame != nullptr) {
            av_frame_free(&frame);
        }
        if (packet != nullptr) {
            av_packet_free(&packet);
        }
    }
};

struct swr_context_guard {
    SwrContext *& ctx;
    ~swr_context_guard() {
        if (ctx != nullptr) {
            swr_free(&ctx);
        }
    }
};

const AVCodec * find_lossy_encoder(seedvc_lossy_codec codec) {
    const AVCodec * enc = nullptr;
    if (codec == SEEDVC_LOSSY_MP3) {
        enc = avcodec_find_encoder_by_name("libmp3lame");
        if (enc == nullptr) {
            enc = avcodec_find_encoder(AV_CODEC_ID_MP3);
        }
    } else {
        enc = avcodec_find_encoder_by_name("libvorbis");
        if (enc == nullptr) {
            enc = avcodec_find_encoder(AV_CODEC_ID_VORBIS);
        }
    }
    return enc;
}

} // namespace

bool seedvc_ffmpeg_encode(
        const std::vector<float> & samples,
        int32_t sample_rate,
        seedvc_lossy_codec codec,
        std::vector<uint8_t> & out,
        std::string & err) {
    out.clear();

    if (sample_rate <= 0) {
        err = "invalid sample rate: " + std::to_string(sample_rate);
        return false;
    }

    const char * muxer_name = codec == SEEDVC_LOSSY_MP3 ? "mp3" : "ogg";
    const AVCodec * enc = find_lossy_encoder(codec);
    if (enc == nullptr) {
        err = std::string("FFmpeg build has no ") + (codec == SEEDVC_LOSSY_MP3 ? "mp3" : "vorbis") + " encoder";
        return false;
    }

    // The custom AVIO context must outlive the muxer, so its guard comes first.
    AVIOContext * io_ctx = nullptr;
    io_context_guard io_guard{io_ctx};

    AVFormatContext * fmt_ctx = nullptr;
    int rc = avformat_alloc_output_context2(&fmt_ctx, nullptr, muxer_name, nullptr);
    output_context_guard fmt_guard{fmt_ctx};
    if (rc < 0 || fmt_ctx == nullptr) {
        err = std::string("failed to allocate ") + muxer_name + " muxer: " + av_err_str(rc);
        return false;
    }

    AVCodecContext * enc_ctx = avcodec_alloc_context3(enc);
    codec_context_guard enc_guard{enc_ctx};
    if (enc_ctx == nullptr) {
        err = "failed to allocate encoder context";
        return false;
    }

    enc_ctx->sample_rate = sample_rate;
    enc_ctx->sample_fmt = AV_SAMPLE_FMT_FLTP;
    av_channel_layout_default(&enc_ctx->ch_layout, 1);
    enc_ctx->time_base = AVRational{1, sample_rate};
    if (codec == SEEDVC_LOSSY_MP3) {
        // MPEG-2 layer III tops out at 160 kbps below 32 kHz.
        enc_ctx->bit_rate = sample_rate >= 32000 ? 320000 : 160000;
    } else {
        enc_ctx->flags |= AV_CODEC_FLAG_QSCALE;
        enc_ctx->global_quality = 6 * FF_QP2LAMBDA;
        if (std::strcmp(enc->name, "libvorbis") != 0) {
            enc_ctx->strict_std_compliance = FF_COMPLIANCE_EXPERIMENTAL;
        }
    }
    if (fmt_ctx->oformat->flags & AVFMT_GLOBALHEADER) {
        enc_ctx->flags |= AV_CODEC_FLAG_GLOBAL_HEADER;
    }

    rc = avcodec_open2(enc_ctx, enc, nullptr);
    if (rc < 0) {
        err = std::string("failed to open ") + enc->name + " encoder: " + av_err_str(rc);
        return false;
    }

    AVStream * stream = avformat_new_stream(fmt_ctx, nullptr);
    if (stream == nullptr) {
        err = "failed to create output stream";
        return false;
    }
    rc = avcodec_parameters_from_context(stream->codecpar, enc_ctx);
    if (rc < 0) {
        err = "failed to copy encoder parameters: " + av_err_str(rc);
        return false;
    }
    stream->time_base = enc_ctx->time_base;

    memory_writer writer;
    writer.out = &out;
    unsigned char * io_buf = (unsigned char *) av_malloc(k_io_buffer_size);
    if (io_buf == nullptr) {
        err = "failed to allocate I/O buffer";
        return false;
    }
    io_ctx = avio_alloc_context(io_buf, k_io_buffer_size, 1, &writer, nullptr, memory_write, memory_write_seek);
    if (io_ctx == nullptr) {
        av_free(io_buf);
        err = "failed to create I/O context";
        return false;
    }
    fmt_ctx->pb = io_ctx;
    fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    rc = avformat_write_header(fmt_ctx, nullptr);
    if (rc < 0) {
        err = std::string("failed to write ") + muxer_name + " header: " + av_err_str(rc);
        return false;
    }

    AVFrame * frame = av_frame_alloc();
    AVPacket * packet = av_packet_alloc();
    frame_packet_guard fp_guard{frame, packet};
    if (frame == nullptr || packet == nullptr) {
        err = "failed to allocate frame/packet";
        return false;
    }

    const bool variable_frames = (enc->capabilities & AV_CODEC_CAP_VARIABLE_FRAME_SIZE) != 0;
    const bool small_last_frame = (enc->capabilities & AV_CODEC_CAP_SMALL_LAST_FRAME) != 0;
    const int frame_size = (enc_ctx->frame_size > 0 && !variable_frames) ? enc_ctx->frame_size : 1024;

    frame->nb_samples = frame_size;
    frame->format = enc_ctx->sample_fmt;
    frame->sample_rate = sample_rate;
    rc = av_channel_layout_copy(&frame->ch_layout, &enc_ctx->ch_layout);
    if (rc >= 0) {
        rc = av_frame_get_buffer(frame, 0);
    }
    if (rc < 0) {
        err = "failed to allocate frame buffer: " + av_err_str(rc);
        return false;
    }

    auto send_and_drain = [&](AVFrame * f) -> bool {
        int r = avcodec_send_frame(enc_ctx, f);
        if (r < 0) {
            err = "encoder rejected frame: " + av_err_str(r);
            return false;
        }
        while (true) {
            r = avcodec_receive_packet(enc_ctx, packet);
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) {
                return true;
            }
            if (r < 0) {
                err = "encoder failed: " + av_err_str(r);
                return false;
            }
            av_packet_rescale_ts(packet, enc_ctx->time_base, stream->time_base);
            packet->stream_index = stream->index;
            r = av_interleaved_write_frame(fmt_ctx, packet);
            if (r < 0) {
                err = "muxer failed: " + av_err_str(r);
                return false;
            }
        }
    };

    int64_t pts = 0;
    for (size_t off = 0; off < samples.size(); off += (size_t) frame_size) {
        const int n = (int) std::min((size_t) frame_size, samples.size() - off);
        rc = av_frame_make_writable(frame);
        if (rc < 0) {
            err = "failed to make frame writable: " + av_err_str(rc);
            return false;
        }
        float * dst = reinterpret_cast<float *>(frame->data[0]);
        for (int i = 0; i < n; ++i) {
            dst[i] = std::clamp(samples[off + (size_t) i], -1.0f, 1.0f);
        }
        if (n < frame_size && !small_last_frame && !variable_frames) {
            std::fill(dst + n, dst + frame_size, 0.0f);
            frame->nb_samples = frame_size;
        } else {
            frame->nb_samples = n;
        }
        frame->pts = pts;
        pts += frame->nb_samples;
        if (!send_and_drain(frame)) {
            return false;
        }
    }
    if (!send_and_drain(nullptr)) {
        return false;
    }

    rc = av_write_trailer(fmt_ctx);
    if (rc < 0) {
        err = std::string("failed to finalize ") + muxer_name + " stream: " + av_err_str(rc);
        return false;
    }
    avio_flush(io_ctx);

    if (out.empty()) {
        err = std::string(muxer_name) + " encoder produced no data";
        return false;
    }
    return true;
}

bool seedvc_ffmpeg_decode(
        const uint8_t * data,
        size_t size,
        int32_t target_sample_rate,
        std::vector<float> & out,
        int32_t & native_sample_rate,
        int32_t & native_channels,
        std::string & err) {
    out.clear();
    native_sample_rate = 0;
    native_channels = 0;

    if (data == nullptr || size == 0) {
        err = "audio buffer is empty";
        return false;
    }
    if (target_sample_rate <= 0) {
        err = "invalid target sample rate: " + std::to_string(target_sample_rate);
        return false;
    }

    memory_reader reader;
    reader.data = data;
    reader.size = size;

    AVIOContext * io_ctx = nullptr;
    io_context_guard io_guard{io_ctx};

    unsigned char * io_buf = (unsigned char *) av_malloc(k_io_buffer_size);
    if (io_buf == nullptr) {
        err = "failed to allocate I/O buffer";
        return false;
    }
    io_ctx = avio_alloc_context(io_buf, k_io_buffer_size, 0, &reader, memory_read, nullptr, memory_read_seek);
    if (io_ctx == nullptr) {
        av_free(io_buf);
        err = "failed to create I/O context";
        return false;
    }

    AVFormatContext * fmt_ctx = avformat_alloc_context();
    if (fmt_ctx == nullptr) {
        err = "failed to allocate demuxer context";
        return false;
    }
    fmt_ctx->pb = io_ctx;
    fmt_ctx->flags |= AVFMT_FLAG_CUSTOM_IO;

    // avformat_open_input frees fmt_ctx on failure.
    int rc = avformat_open_input(&fmt_ctx, nullptr, nullptr, nullptr);
    input_context_guard fmt_guard{fmt_ctx};
    if (rc < 0) {
        err = "failed to open audio stream: " + av_err_str(rc);
        return false;
    }

    rc = avformat_find_stream_info(fmt_ctx, nullptr);
    if (rc < 0) {
        err = "failed to read stream info: " + av_err_str(rc);
        return false;
    }

    const AVCodec * dec = nullptr;
    const int stream_index = av_find_best_stream(fmt_ctx, AVMEDIA_TYPE_AUDIO, -1, -1, &dec, 0);
    if (stream_index < 0 || dec == nullptr) {
        err = "no decodable audio stream found";
        return false;
    }

    AVCodecContext * dec_ctx = avcodec_alloc_context3(dec);
    codec_context_guard dec_guard{dec_ctx};
    if (dec_ctx == nullptr) {
        err = "failed to allocate decoder context";
        return false;
    }
    rc = avcodec_parameters_to_context(dec_ctx, fmt_ctx->streams[stream_index]->codecpar);
    if (rc < 0) {
        err = "failed to copy decoder parameters: " + av_err_str(rc);
        return false;
    }
    rc = avcodec_open2(dec_ctx, dec, nullptr);
    if (rc < 0) {
        err = std::string("failed to open ") + dec->name + " decoder: " + av_err_str(rc);
        return false;
    }

    native_sample_rate = dec_ctx->sample_rate;
    native_channels = dec_ctx->ch_layout.nb_channels;
    if (native_sample_rate <= 0 || native_channels <= 0) {
        err = "audio stream has no sample rate or channel layout";
        return false;
    }

    AVChannelLayout in_layout = {};
    if (dec_ctx->ch_layout.order == AV_CHANNEL_ORDER_UNSPEC) {
        av_channel_layout_default(&in_layout, native_channels);
    } else {
        rc = av_channel_layout_copy(&in_layout, &dec_ctx->ch_layout);
        if (rc < 0) {
            err = "failed to copy channel layout: " + av_err_str(rc);
            return false;
        }
    }
    AVChannelLayout out_layout = {};
    av_channel_layout_default(&out_layout, 1);

    SwrContext * swr = nullptr;
    swr_context_guard swr_guard{swr};
    rc = swr_alloc_set_opts2(&swr,
            &out_layout, AV_SAMPLE_FMT_FLT, target_sample_rate,
            &in_layout, dec_ctx->sample_fmt, native_sample_rate,
            0, nullptr);
    av_channel_layout_uninit(&in_layout);
    av_channel_layout_uninit(&out_layout);
    if (rc < 0 || swr == nullptr) {
        err = "failed to allocate resampler: " + av_err_str(rc);
        return false;
    }
    rc = swr_init(swr);
    if (rc < 0) {
        err = "failed to initialize resampler: " + av_err_str(rc);
        return false;
    }

    AVFrame * frame = av_frame_alloc();
    AVPacket * packet = av_packet_alloc();
    frame_packet_guard fp_guard{frame, packet};
    if (frame == nullptr || packet == nullptr) {
        err = "failed to allocate frame/packet";
        return false;
    }

    std::vector<float> tmp;
    auto convert_frames = [&]() -> bool {
        while (true) {
            int r = avcodec_receive_frame(dec_ctx, frame);
            if (r == AVERROR(EAGAIN) || r == AVERROR_EOF) {
                return true;
            }
            if (r < 0) {
                err = "decoder failed: " + av_err_str(r);
                return false;
            }
            const int64_t cap = av_rescale_rnd(
                    swr_get_delay(swr, native_sample_rate) + frame->nb_samples,
                    target_sample_rate, native_sample_rate, AV_ROUND_UP);
            tmp.resize((size_t) cap);
            uint8_t * dst = reinterpret_cast<uint8_t *>(tmp.data());
            const int n = swr_convert(swr, &dst, (int) cap,
                    const_cast<const uint8_t **>(frame->extended_data), frame->nb_samples);
            av_frame_unref(frame);
            if (n < 0) {
                err = "resampler failed: " + av_err_str(n);
                return false;
            }
            out.insert(out.end(), tmp.begin(), tmp.begin() + n);
        }
    };

    while ((rc = av_read_frame(fmt_ctx, packet)) >= 0) {
        if (packet->stream_index != stream_index) {
            av_packet_unref(packet);
            continue;
        }
        rc = avcodec_send_packet(dec_ctx, packet);
        if (rc == AVERROR(EAGAIN)) {
            // Decoder output is full: drain it, then resend the same packet.
            if (!convert_frames()) {
                av_packet_unref(packet);
                return false;
            }
            rc = avcodec_send_packet(dec_ctx, packet);
        }
        av_packet_unref(packet);
        if (rc < 0) {
            // Corrupt packets are skipped like a player would.
            continue;
        }
        if (!convert_frames()) {
            return false;
        }
    }
    if (rc != AVERROR_EOF) {
        err = "failed to read audio packets: " + av_err_str(rc);
        return false;
    }

    rc = avcodec_send_packet(dec_ctx, nullptr);
    if (rc < 0 && rc != AVERROR_EOF) {
        err = "failed to flush decoder: " + av_err_str(rc);
        return false;
    }
    if (!convert_frames()) {
        return false;
    }

    while (true) {
        const int64_t cap = av_rescale_rnd(swr_get_delay(swr, native_sample_rate) + 32,
                target_sample_rate, native_sample_rate, AV_ROUND_UP);
        tmp.resize((size_t) std::max<int64_t>(cap, 32));
        uint8_t * dst = reinterpret_cast<uint8_t *>(tmp.data());
        const int n = swr_convert(swr, &dst, (int) tmp.size(), nullptr, 0);
        if (n <= 0) {
            break;
        }
        out.insert(out.end(), tmp.begin(), tmp.begin() + n);
    }

    if (out.empty()) {
        err = "no audio samples decoded";
        return false;
    }
    return true;
}
