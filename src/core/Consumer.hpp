/**
 * @file Consumer.hpp
 * @brief Interface for anything that receives captured blocks.
 */

#ifndef OMEGA_CONSUMER_HPP
#define OMEGA_CONSUMER_HPP

#include "AudioBlock.hpp"
#include <functional>
#include <memory>
#include <utility>

namespace omega {

/**
 * @brief Receives every dequeued block on the processing thread.
 *
 * Implementations may throw; AudioManager catches and logs the failure and
 * carries on with the remaining consumers.
 */
class Consumer {
public:
    virtual ~Consumer() = default;

    virtual void on_block(const AudioBlock& block, int sample_rate) = 0;
};

/**
 * @brief Adapts a plain function object to the Consumer interface.
 */
class CallbackConsumer : public Consumer {
public:
    using Callback = std::function<void(const AudioBlock&, int)>;

    explicit CallbackConsumer(Callback callback)
        : callback_(std::move(callback))
    {}

    void on_block(const AudioBlock& block, int sample_rate) override {
        if (callback_) callback_(block, sample_rate);
    }

private:
    Callback callback_;
};

inline std::shared_ptr<Consumer> make_consumer(CallbackConsumer::Callback callback) {
    return std::make_shared<CallbackConsumer>(std::move(callback));
}

} // namespace omega

#endif // OMEGA_CONSUMER_HPP
