#include "plugin-engine.h"

#include <dlfcn.h>

#include <cstdio>
#include <cstring>

namespace {

class plugin_session : public engine_session {
public:
    plugin_session(seedvc_engine_session * handle, void (*free_fn)(seedvc_engine_session *))
        : handle_(handle), free_fn_(free_fn) {
    }

    ~plugin_session() override {
        if (handle_ != nullptr && free_fn_ != nullptr) {
            free_fn_(handle_);
        }
    }

    seedvc_engine_session * handle() const { return handle_; }

private:
    seedvc_engine_session * handle_ = nullptr;
    void (*free_fn_)(seedvc_engine_session *) = nullptr;
};

seedvc_engine_conversion_params to_abi_params(const conversion_params & p) {
    seedvc_engine_conversion_params out;
    out.diffusion_steps = p.diffusion_steps;
    out.length_adjust = p.length_adjust;
    out.intelligibility_cfg_rate = p.intelligibility_cfg_rate;
    out.similarity_cfg_rate = p.similarity_cfg_rate;
    out.top_p = p.top_p;
    out.temperature = p.temperature;
    out.repetition_penalty = p.repetition_penalty;
    out.convert_style = p.convert_style ? 1 : 0;
    out.anonymization_only = p.anonymization_only ? 1 : 0;
    return out;
}

void plugin_log_callback(int32_t level, const char * text, void * /* user_data */) {
    if (text == nullptr || level < 2) {
        return;
    }
    std::fprintf(stderr, "engine: %s%s", text, (text[0] != '\0' && text[std::strlen(text) - 1] == '\n') ? "" : "\n");
}

template<typename T>
bool resolve_symbol(void * handle, const char * name, T & out, std::string & err) {
    dlerror();
    void * sym = dlsym(handle, name);
    if (sym == nullptr) {
        const char * e = dlerror();
        err = std::string("missing symbol ") + name + (e != nullptr ? std::string(": ") + e : std::string());
        return false;
    }
    out = reinterpret_cast<T>(sym);
    return true;
}

} // namespace

plugin_voice_model_engine::plugin_voice_model_engine() = default;

plugin_voice_model_engine::~plugin_voice_model_engine() {
    unload();
}

void plugin_voice_model_engine::unload() {
    if (engine_ != nullptr && fn_destroy_ != nullptr) {
        fn_destroy_(engine_);
    }
    engine_ = nullptr;
    if (handle_ != nullptr) {
        dlclose(handle_);
        handle_ = nullptr;
    }
    fn_create_ = nullptr;
    fn_destroy_ = nullptr;
    fn_get_info_ = nullptr;
    fn_prepare_reference_ = nullptr;
    fn_convert_ = nullptr;
    fn_session_free_ = nullptr;
    fn_audio_free_ = nullptr;
    info_ = engine_info();
    load_error_ = "engine library not loaded";
}

bool plugin_voice_model_engine::load(const plugin_engine_config & cfg, std::string & err) {
    unload();

    auto fail = [&](const std::string & msg) {
        err = msg;
        unload();
        load_error_ = msg;
        return false;
    };

    if (cfg.library_path.empty()) {
        return fail("no engine library configured (--engine-lib or SEEDVC_ENGINE_LIB)");
    }

    handle_ = dlopen(cfg.library_path.c_str(), RTLD_NOW | RTLD_LOCAL);
    if (handle_ == nullptr) {
        const char * e = dlerror();
        return fail("failed to load engine library " + cfg.library_path + ": " + (e != nullptr ? e : "unknown error"));
    }

    std::string sym_err;
    if (!resolve_symbol(handle_, "seedvc_engine_create", fn_create_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_destroy", fn_destroy_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_get_info", fn_get_info_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_prepare_reference", fn_prepare_reference_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_convert", fn_convert_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_session_free", fn_session_free_, sym_err) ||
        !resolve_symbol(handle_, "seedvc_engine_audio_free", fn_audio_free_, sym_err)) {
        return fail("engine library " + cfg.library_path + " is incomplete: " + sym_err);
    }

    set_log_callback_fn fn_set_log = nullptr;
    std::string opt_err;
    if (resolve_symbol(handle_, "seedvc_engine_set_log_callback", fn_set_log, opt_err)) {
        fn_set_log(plugin_log_callback, nullptr);
    }

    seedvc_engine_config c_cfg;
    c_cfg.ar_checkpoint_path = cfg.ar_checkpoint_path.empty() ? nullptr : cfg.ar_checkpoint_path.c_str();
    c_cfg.cfm_checkpoint_path = cfg.cfm_checkpoint_path.empty() ? nullptr : cfg.cfm_checkpoint_path.c_str();
    c_cfg.device = cfg.device.empty() ? nullptr : cfg.device.c_str();
    c_cfg.compile = cfg.compile ? 1 : 0;
    c_cfg.n_threads = cfg.n_threads;

    char c_err[1024] = {0};
    engine_ = fn_create_(&c_cfg, c_err, sizeof(c_err));
    if (engine_ == nullptr) {
        return fail(std::string("engine initialization failed: ") + (c_err[0] != '\0' ? c_err : "unknown error"));
    }

    seedvc_engine_info c_info;
    std::memset(&c_info, 0, sizeof(c_info));
    if (!fn_get_info_(engine_, &c_info)) {
        return fail("engine did not report its info");
    }
    if (c_info.abi_version != SEEDVC_ENGINE_ABI_VERSION) {
        return fail("engine ABI version " + std::to_string(c_info.abi_version) +
                " does not match " + std::to_string(SEEDVC_ENGINE_ABI_VERSION));
    }
    if (c_info.sample_rate <= 0 || c_info.max_chunk_samples <= 0) {
        return fail("engine reported an invalid sample rate or maximum chunk length");
    }

    info_.name = c_info.name != nullptr ? c_info.name : "unnamed";
    info_.sample_rate = c_info.sample_rate;
    info_.hop_size = c_info.hop_size > 0 ? c_info.hop_size : 256;
    info_.max_chunk_samples = c_info.max_chunk_samples;
    info_.batched_occupancy = c_info.batched_occupancy != 0;
    info_.job_workspace_bytes = c_info.job_workspace_bytes;
    load_error_.clear();

    return true;
}

bool plugin_voice_model_engine::is_loaded() const {
    return engine_ != nullptr;
}

std::string plugin_voice_model_engine::load_error() const {
    return load_error_;
}

const engine_info & plugin_voice_model_engine::info() const {
    return info_;
}

std::unique_ptr<engine_session> plugin_voice_model_engine::prepare_reference(
        const std::vector<float> & reference,
        const conversion_params & params,
        std::string & err) {
    if (engine_ == nullptr) {
        err = load_error_;
        return nullptr;
    }
    const seedvc_engine_conversion_params c_params = to_abi_params(params);
    char c_err[1024] = {0};
    seedvc_engine_session * s = fn_prepare_reference_(
            engine_, reference.data(), reference.size(), &c_params, c_err, sizeof(c_err));
    if (s == nullptr) {
        err = c_err[0] != '\0' ? c_err : "reference preparation failed";
        return nullptr;
    }
    return std::make_unique<plugin_session>(s, fn_session_free_);
}

bool plugin_voice_model_engine::convert(
        engine_session & session,
        const audio_chunk & chunk,
        const conversion_params & params,
        std::vector<float> & out,
        std::string & err) {
    if (engine_ == nullptr) {
        err = load_error_;
        return false;
    }
    auto * ps = dynamic_cast<plugin_session *>(&session);
    if (ps == nullptr) {
        err = "session was not created by this engine";
        return false;
    }

    const seedvc_engine_conversion_params c_params = to_abi_params(params);
    float * audio = nullptr;
    size_t n_audio = 0;
    char c_err[1024] = {0};
    if (!fn_convert_(engine_, ps->handle(), chunk.samples.data(), chunk.samples.size(), chunk.index,
                     &c_params, &audio, &n_audio, c_err, sizeof(c_err))) {
        if (audio != nullptr) {
            fn_audio_free_(audio);
        }
        err = c_err[0] != '\0' ? c_err : "engine conversion failed";
        return false;
    }

    if (audio == nullptr && n_audio > 0) {
        err = "engine reported " + std::to_string(n_audio) + " samples but returned no buffer";
        return false;
    }
    try {
        out.assign(audio, audio + n_audio);
    } catch (...) {
        fn_audio_free_(audio);
        throw;
    }
    if (audio != nullptr) {
        fn_audio_free_(audio);
    }
    return true;
}
