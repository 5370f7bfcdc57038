#pragma once
#include <cstdint>
#include <vector>
#include <SDL.h>

// Beeper for the Chip-8 sound timer.
//
// The machine only exposes "sound timer > 0"; while that holds we emit a
// square wave at a fixed pitch, otherwise silence.  Samples are generated
// one video frame at a time and pushed with SDL_QueueAudio (push model),
// the same cadence at which the timers tick.
//
// A first-order IIR low-pass rounds the square edges so the tone starting
// and stopping does not click.
class Sound {
public:
    static constexpr int      SAMPLE_RATE      = 44100;
    static constexpr int      SAMPLES_PER_FRAME = SAMPLE_RATE / 60;
    // α for ~6 kHz cutoff at 44100 Hz:
    //   RC = 1/(2π × 6000) ≈ 26.5 µs,  dt ≈ 22.7 µs,  α = dt / (RC + dt) ≈ 0.46
    static constexpr float    LP_ALPHA         = 0.46f;
    // Quiet by default: a raw square wave at full scale is harsh.
    static constexpr int16_t  AMPLITUDE        = 3000;
    static constexpr int      MAX_QUEUED_FRAMES = 4;  // max ~67 ms queued

    // Open SDL audio device.  Non-fatal: if it fails, update/flush are no-ops.
    bool init(int tone_hz = 440);
    void cleanup();

    // Call once per 60Hz frame with Machine::is_sound_active().
    void update(bool active);

    // Push the frame's samples to SDL, capped at MAX_QUEUED_FRAMES.
    void flush();

    // Drop buffered samples and the SDL queue (pause / shutdown).
    void clear();

    bool is_open() const { return device_ != 0; }

private:
    SDL_AudioDeviceID device_   = 0;
    float             phase_    = 0.0f;   // 0.0 … 1.0 through one period
    float             phase_inc_ = 440.0f / SAMPLE_RATE;
    float             lp_state_ = 0.0f;
    std::vector<int16_t> buf_;
};
