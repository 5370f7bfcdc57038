#include "Sound.hpp"
#include <iostream>

bool Sound::init(int tone_hz) {
    if (SDL_InitSubSystem(SDL_INIT_AUDIO) < 0) {
        std::cerr << "[SOUND] SDL_InitSubSystem(AUDIO) failed: "
                  << SDL_GetError() << "\n";
        return false;
    }

    SDL_AudioSpec want{}, have{};
    want.freq     = SAMPLE_RATE;
    want.format   = AUDIO_S16SYS;
    want.channels = 1;
    want.samples  = 512;
    want.callback = nullptr;   // queue mode: we push via SDL_QueueAudio

    device_ = SDL_OpenAudioDevice(nullptr, 0, &want, &have, 0);
    if (device_ == 0) {
        std::cerr << "[SOUND] SDL_OpenAudioDevice failed: "
                  << SDL_GetError() << "\n";
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        return false;         // non-fatal — emulator continues without sound
    }

    phase_inc_ = static_cast<float>(tone_hz) / static_cast<float>(have.freq);
    buf_.reserve(SAMPLES_PER_FRAME + 64);

    SDL_PauseAudioDevice(device_, 0);
    std::cout << "[SOUND] Audio opened: " << have.freq << " Hz, "
              << (int)have.channels << " ch, tone " << tone_hz << " Hz\n";
    return true;
}

void Sound::cleanup() {
    if (device_) {
        SDL_CloseAudioDevice(device_);
        device_ = 0;
        SDL_QuitSubSystem(SDL_INIT_AUDIO);
    }
}

void Sound::update(bool active) {
    if (device_ == 0) return;

    for (int n = 0; n < SAMPLES_PER_FRAME; n++) {
        float raw = 0.0f;
        if (active) {
            raw = (phase_ < 0.5f) ? 1.0f : -1.0f;
            phase_ += phase_inc_;
            if (phase_ >= 1.0f) phase_ -= 1.0f;
        }
        // y[n] = α × x[n] + (1–α) × y[n–1]
        lp_state_ = LP_ALPHA * raw + (1.0f - LP_ALPHA) * lp_state_;
        buf_.push_back(static_cast<int16_t>(lp_state_ * AMPLITUDE));
    }
}

void Sound::flush() {
    if (device_ == 0) { buf_.clear(); return; }
    if (buf_.empty()) return;

    const uint32_t max_bytes    = static_cast<uint32_t>(
        SAMPLES_PER_FRAME * MAX_QUEUED_FRAMES * sizeof(int16_t));
    const uint32_t queued_bytes = SDL_GetQueuedAudioSize(device_);
    if (queued_bytes < max_bytes) {
        uint32_t room_bytes = max_bytes - queued_bytes;
        uint32_t push_bytes = static_cast<uint32_t>(buf_.size() * sizeof(int16_t));
        if (push_bytes > room_bytes) push_bytes = room_bytes;
        if (SDL_QueueAudio(device_, buf_.data(), push_bytes) < 0)
            std::cerr << "[SOUND] SDL_QueueAudio failed: " << SDL_GetError() << "\n";
    }
    buf_.clear();
}

void Sound::clear() {
    buf_.clear();
    lp_state_ = 0.0f;
    phase_    = 0.0f;
    if (device_) SDL_ClearQueuedAudio(device_);
}
