#pragma once

#include "voxcast-stream-consumer.h"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

struct voxcast_audio_player_impl;

// Plays scheduled chunks on the default output device. The device clock
// (frames rendered / sample rate) drives the gapless scheduler.
class voxcast_audio_player : public voxcast_playback_sink {
public:
    voxcast_audio_player();
    ~voxcast_audio_player() override;

    voxcast_audio_player(const voxcast_audio_player &) = delete;
    voxcast_audio_player & operator=(const voxcast_audio_player &) = delete;

    bool open(int32_t sample_rate, std::string & err);
    void close();
    bool is_open() const;

    void play_chunk(const std::vector<float> & samples, int32_t sample_rate) override;
    void reset() override;

    // Seconds of audio rendered since open().
    double current_time() const;

    // Waits until every queued buffer has been rendered.
    bool wait_until_drained(int32_t timeout_ms);

    const std::string & last_error() const;

private:
    std::unique_ptr<voxcast_audio_player_impl> impl_;
};
