#pragma once

#include "seedvc-engine-abi.h"
#include "voice-engine.h"

#include <string>

struct plugin_engine_config {
    std::string library_path;
    std::string ar_checkpoint_path;
    std::string cfm_checkpoint_path;
    std::string device;
    bool compile = false;
    int32_t n_threads = 0;
};

// voice_model_engine backed by a shared library exporting seedvc-engine-abi.h.
// A failed load() leaves the object usable: is_loaded() is false and
// load_error() says why, so every request can report it.
class plugin_voice_model_engine : public voice_model_engine {
public:
    plugin_voice_model_engine();
    ~plugin_voice_model_engine() override;

    plugin_voice_model_engine(const plugin_voice_model_engine &) = delete;
    plugin_voice_model_engine & operator=(const plugin_voice_model_engine &) = delete;

    bool load(const plugin_engine_config & cfg, std::string & err);
    void unload();

    bool is_loaded() const override;
    std::string load_error() const override;
    const engine_info & info() const override;

    std::unique_ptr<engine_session> prepare_reference(
            const std::vector<float> & reference,
            const conversion_params & params,
            std::string & err) override;

    bool convert(
            engine_session & session,
            const audio_chunk & chunk,
            const conversion_params & params,
            std::vector<float> & out,
            std::string & err) override;

private:
    typedef seedvc_engine * (*create_fn)(const seedvc_engine_config *, char *, size_t);
    typedef void (*destroy_fn)(seedvc_engine *);
    typedef bool (*get_info_fn)(const seedvc_engine *, seedvc_engine_info *);
    typedef seedvc_engine_session * (*prepare_reference_fn)(
            seedvc_engine *, const float *, size_t, const seedvc_engine_conversion_params *, char *, size_t);
    typedef bool (*convert_fn)(
            seedvc_engine *, seedvc_engine_session *, const float *, size_t, int32_t,
            const seedvc_engine_conversion_params *, float **, size_t *, char *, size_t);
    typedef void (*session_free_fn)(seedvc_engine_session *);
    typedef void (*audio_free_fn)(float *);
    typedef void (*set_log_callback_fn)(seedvc_engine_log_callback, void *);

    void * handle_ = nullptr;
    seedvc_engine * engine_ = nullptr;

    create_fn fn_create_ = nullptr;
    destroy_fn fn_destroy_ = nullptr;
    get_info_fn fn_get_info_ = nullptr;
    prepare_reference_fn fn_prepare_reference_ = nullptr;
    convert_fn fn_convert_ = nullptr;
    session_free_fn fn_session_free_ = nullptr;
    audio_free_fn fn_audio_free_ = nullptr;

    engine_info info_;
    std::string load_error_ = "engine library not loaded";
};
