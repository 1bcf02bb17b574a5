#include "playback/mixer.h"

#include "core/timing.h"
#include "logging/logger.h"

#include <algorithm>
#include <cmath>
#include <cstring>

namespace playout {

const char* playbackStateToString(PlaybackState state) {
    switch (state) {
    case PlaybackState::Playing:
        return "playing";
    case PlaybackState::Paused:
    default:
        return "paused";
    }
}

Mixer::Mixer(const EngineConfig& config)
    : workingRate_(config.workingSampleRate),
      readyFrames_(Backpressure::readyFrames(config)),
      decayFactor_(config.pauseDecayFactor),
      decayFloor_(config.pauseDecayFloor),
      resumeFadeFrames_(static_cast<size_t>(config.resumeFadeInMs) * config.workingSampleRate /
                        1000),
      resumeFadeCurve_(config.resumeFadeCurve),
      masterVolume_(std::clamp(config.masterVolume, 0.0f, 1.0f)),
      scratchCurrent_(kMaxBlockFrames * 2, 0.0f),
      scratchNext_(kMaxBlockFrames * 2, 0.0f) {}

void Mixer::mix(float* output, size_t frames) {
    if (output == nullptr) {
        return;
    }
    size_t done = 0;
    while (done < frames) {
        const size_t block = std::min(kMaxBlockFrames, frames - done);
        mixBlock(output + done * 2, block);
        done += block;
    }
    framesWritten_.fetch_add(frames, std::memory_order_relaxed);
}

std::vector<float> Mixer::mix(size_t frames) {
    std::vector<float> output(frames * 2, 0.0f);
    mix(output.data(), frames);
    return output;
}

void Mixer::mixBlock(float* output, size_t frames) {
    const PlaybackState requested = state_.load(std::memory_order_acquire);
    if (requested == PlaybackState::Playing && renderedState_ == PlaybackState::Paused &&
        playedFrames_ > 0 && resumeFadeFrames_ > 0) {
        resumeFading_ = true;
        resumeFadePosition_ = 0;
    }
    renderedState_ = requested;

    if (requested == PlaybackState::Paused) {
        mixPaused(output, frames);
        return;
    }

    mixPlaying(output, frames);
    playedFrames_ += frames;

    if (resumeFading_) {
        for (size_t i = 0; i < frames && resumeFading_; ++i) {
            const float x = static_cast<float>(resumeFadePosition_) /
                            static_cast<float>(resumeFadeFrames_);
            const float gain = fadeInGain(resumeFadeCurve_, x);
            output[i * 2] *= gain;
            output[i * 2 + 1] *= gain;
            if (++resumeFadePosition_ >= resumeFadeFrames_) {
                resumeFading_ = false;
            }
        }
    }

    const float volume = masterVolume_.load(std::memory_order_relaxed);
    if (volume != 1.0f) {
        for (size_t i = 0; i < frames * 2; ++i) {
            output[i] *= volume;
        }
    }

    if (frames > 0) {
        lastFrame_[0] = output[(frames - 1) * 2];
        lastFrame_[1] = output[(frames - 1) * 2 + 1];
    }
}

void Mixer::mixPaused(float* output, size_t frames) {
    // Decay the last emitted frame towards silence instead of cutting it.
    for (size_t i = 0; i < frames; ++i) {
        for (size_t ch = 0; ch < 2; ++ch) {
            float value = lastFrame_[ch] * decayFactor_;
            if (std::fabs(value) < decayFloor_) {
                value = 0.0f;
            }
            lastFrame_[ch] = value;
            output[i * 2 + ch] = value;
        }
    }
}

void Mixer::mixPlaying(float* output, size_t frames) {
    mixesStarted_.fetch_add(1, std::memory_order_acq_rel);

    Sources local;
    uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(sourceMutex_);
        local = sources_;
        generation = generation_;
    }
    completedCount_ = 0;

    size_t done = 0;
    while (done < frames) {
        float* dst = output + done * 2;
        const size_t want = frames - done;

        if (!local.current.valid()) {
            if (local.next.valid()) {
                promoteNext(local);
                continue;
            }
            std::memset(dst, 0, want * 2 * sizeof(float));
            break;
        }

        if (!local.overlapping && local.next.valid() && local.current.crossfadeStartFrame &&
            local.current.positionFrames >= *local.current.crossfadeStartFrame &&
            isReady(local.next)) {
            local.overlapping = true;
            LOG_TRACE("Mixer: crossfade {} -> {} at frame {}", local.current.id, local.next.id,
                      local.current.positionFrames);
        }

        const size_t got = local.overlapping ? readOverlap(local, dst, want)
                                             : readCurrent(local, dst, want);
        if (got > 0) {
            done += got;
            continue;
        }

        if (local.current.buffer->isExhausted()) {
            completeCurrent(local);
            continue;
        }

        // Underrun: keep the output running on silence
        std::memset(dst, 0, want * 2 * sizeof(float));
        underrunFrames_.fetch_add(want, std::memory_order_relaxed);
        LOG_EVERY_N(WARN, 100, "Mixer: buffer underrun on passage {} ({} frames)",
                    local.current.id, want);
        break;
    }

    {
        std::lock_guard<std::mutex> lock(sourceMutex_);
        if (generation_ == generation) {
            sources_ = std::move(local);
        } else {
            reconcile(local);
        }
        publishPosition();
    }
    mixesCompleted_.fetch_add(1, std::memory_order_acq_rel);
}

size_t Mixer::readCurrent(Sources& sources, float* output, size_t frames) {
    Source& current = sources.current;
    size_t limit = frames;
    if (sources.next.valid() && current.crossfadeStartFrame &&
        current.positionFrames < *current.crossfadeStartFrame) {
        limit = std::min<uint64_t>(limit, *current.crossfadeStartFrame - current.positionFrames);
    }

    const size_t got = current.buffer->pop(output, limit);
    if (got > 0) {
        announce(current);
        current.positionFrames += got;
    }
    return got;
}

size_t Mixer::readOverlap(Sources& sources, float* output, size_t frames) {
    Source& current = sources.current;
    Source& next = sources.next;
    if (!next.valid()) {
        sources.overlapping = false;
        return readCurrent(sources, output, frames);
    }

    // A short next passage may run out first; it then contributes silence.
    const bool nextExhausted = next.buffer->isExhausted();

    size_t count = std::min({frames, current.buffer->len(), kMaxBlockFrames});
    if (!nextExhausted) {
        const size_t nextAvailable = next.buffer->len();
        if (nextAvailable == 0) {
            // Next is starved: the current passage stays audible on its own
            return readCurrent(sources, output, count);
        }
        count = std::min(count, nextAvailable);
    }
    if (count == 0) {
        return 0;
    }

    const size_t got = current.buffer->pop(scratchCurrent_.data(), count);
    if (nextExhausted) {
        std::memcpy(output, scratchCurrent_.data(), got * 2 * sizeof(float));
    } else {
        next.buffer->pop(scratchNext_.data(), got);
        for (size_t i = 0; i < got * 2; ++i) {
            output[i] = std::clamp(scratchCurrent_[i] + scratchNext_[i], -1.0f, 1.0f);
        }
        announce(next);
        next.positionFrames += got;
    }

    announce(current);
    current.positionFrames += got;
    return got;
}

bool Mixer::isReady(const Source& source) const {
    return source.buffer->isFinished() || source.buffer->len() >= readyFrames_;
}

void Mixer::completeCurrent(Sources& sources) {
    pushEvent(MixerEvent::Type::Completed, sources.current.id);
    if (completedCount_ < completedInBlock_.size()) {
        completedInBlock_[completedCount_++] = sources.current.id;
    }
    sources.current = Source{};
    sources.overlapping = false;
    if (sources.next.valid()) {
        promoteNext(sources);
    }
}

void Mixer::promoteNext(Sources& sources) {
    sources.current = std::move(sources.next);
    sources.next = Source{};
    sources.overlapping = false;
}

void Mixer::reconcile(const Sources& mixed) {
    // Control calls changed the slots while the block was mixed: their
    // membership wins, progress made on sources still present is kept.
    for (Source* slot : {&sources_.current, &sources_.next}) {
        if (!slot->valid()) {
            continue;
        }
        const bool completed =
            std::find(completedInBlock_.begin(), completedInBlock_.begin() + completedCount_,
                      slot->id) != completedInBlock_.begin() + completedCount_;
        if (completed) {
            *slot = Source{};
            continue;
        }
        for (const Source* source : {&mixed.current, &mixed.next}) {
            if (source->id == slot->id && source->buffer == slot->buffer) {
                slot->positionFrames = source->positionFrames;
                slot->announced = source->announced;
            }
        }
    }
    if (!sources_.current.valid() && sources_.next.valid()) {
        promoteNext(sources_);
    }
    sources_.overlapping = mixed.overlapping && sources_.current.id == mixed.current.id &&
                           sources_.next.id == mixed.next.id;
}

void Mixer::announce(Source& source) {
    if (!source.announced) {
        source.announced = true;
        pushEvent(MixerEvent::Type::Started, source.id);
    }
}

void Mixer::pushEvent(MixerEvent::Type type, PassageId id) {
    const size_t tail = eventTail_.load(std::memory_order_relaxed);
    const size_t nextTail = (tail + 1) % kEventCapacity;
    if (nextTail == eventHead_.load(std::memory_order_acquire)) {
        droppedEvents_.fetch_add(1, std::memory_order_relaxed);
        return;
    }
    events_[tail] = MixerEvent{type, id};
    eventTail_.store(nextTail, std::memory_order_release);
}

void Mixer::publishPosition() {
    positionFrames_.store(sources_.current.valid() ? sources_.current.positionFrames : 0,
                          std::memory_order_relaxed);
}

void Mixer::drainEvents(std::vector<MixerEvent>& out) {
    size_t head = eventHead_.load(std::memory_order_relaxed);
    const size_t tail = eventTail_.load(std::memory_order_acquire);
    while (head != tail) {
        out.push_back(events_[head]);
        head = (head + 1) % kEventCapacity;
    }
    eventHead_.store(head, std::memory_order_release);

    const uint64_t dropped = droppedEvents_.exchange(0, std::memory_order_relaxed);
    if (dropped > 0) {
        LOG_WARN("Mixer: {} output events dropped (event ring full)", dropped);
    }
}

bool Mixer::setCurrentIfIdle(PassageId id, std::shared_ptr<PlayoutRingBuffer> buffer,
                             std::optional<int64_t> crossfadeOffsetTicks) {
    if (id == kInvalidPassageId || !buffer) {
        return false;
    }
    std::lock_guard<std::mutex> lock(sourceMutex_);
    if (sources_.current.valid() || sources_.next.valid()) {
        return false;
    }
    Source& current = sources_.current;
    current.id = id;
    current.buffer = std::move(buffer);
    current.crossfadeStartFrame = toFrames(crossfadeOffsetTicks);
    current.positionFrames = 0;
    current.announced = false;
    sources_.overlapping = false;
    ++generation_;
    publishPosition();
    return true;
}

bool Mixer::armNext(PassageId expectedCurrent, PassageId id,
                    std::shared_ptr<PlayoutRingBuffer> buffer,
                    std::optional<int64_t> crossfadeOffsetTicks) {
    if (id == kInvalidPassageId || !buffer) {
        return false;
    }
    std::lock_guard<std::mutex> lock(sourceMutex_);
    if (sources_.current.id != expectedCurrent || !sources_.current.valid() ||
        sources_.next.valid()) {
        return false;
    }
    Source& next = sources_.next;
    next.id = id;
    next.buffer = std::move(buffer);
    next.crossfadeStartFrame = toFrames(crossfadeOffsetTicks);
    next.positionFrames = 0;
    next.announced = false;
    ++generation_;
    return true;
}

bool Mixer::removeSource(PassageId id) {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    if (sources_.current.valid() && sources_.current.id == id) {
        sources_.current = Source{};
        sources_.overlapping = false;
        if (sources_.next.valid()) {
            promoteNext(sources_);
        }
        ++generation_;
        publishPosition();
        return true;
    }
    if (sources_.next.valid() && sources_.next.id == id) {
        sources_.next = Source{};
        sources_.overlapping = false;
        ++generation_;
        return true;
    }
    return false;
}

void Mixer::clearSources() {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    sources_ = Sources{};
    ++generation_;
    publishPosition();
}

PassageId Mixer::currentPassage() const {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    return sources_.current.id;
}

PassageId Mixer::nextPassage() const {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    return sources_.next.id;
}

bool Mixer::isOverlapping() const {
    std::lock_guard<std::mutex> lock(sourceMutex_);
    return sources_.overlapping;
}

void Mixer::play() {
    state_.store(PlaybackState::Playing, std::memory_order_release);
}

void Mixer::pause() {
    state_.store(PlaybackState::Paused, std::memory_order_release);
}

void Mixer::setMasterVolume(float volume) {
    if (std::isnan(volume)) {
        volume = 0.0f;
    }
    masterVolume_.store(std::clamp(volume, 0.0f, 1.0f), std::memory_order_relaxed);
}

int64_t Mixer::positionTicks() const {
    return timing::samplesToTicks(static_cast<size_t>(positionFrames()), workingRate_);
}

std::optional<uint64_t> Mixer::toFrames(std::optional<int64_t> ticks) const {
    if (!ticks) {
        return std::nullopt;
    }
    // First frame at or after the offset, the same frame the fader starts on
    return static_cast<uint64_t>(timing::ticksToSamplesCeil(*ticks, workingRate_));
}

}  // namespace playout
