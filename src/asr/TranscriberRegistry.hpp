#pragma once

#include "ITranscriber.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace asr
{

/**
 * @brief Lazily builds and caches one transcriber per configuration
 *
 * The registry is owned by the caller; transcribers live as long as it does. Concurrent get()
 * calls for the same configuration construct it once, the others wait. A factory that throws
 * leaves the slot empty so a later get() retries.
 */
class TranscriberRegistry
{
public:
    using Factory = std::function<std::unique_ptr<ITranscriber>(const TranscriberConfig&)>;

    explicit TranscriberRegistry(Factory factory);
    ~TranscriberRegistry();

    TranscriberRegistry(const TranscriberRegistry&) = delete;
    TranscriberRegistry& operator=(const TranscriberRegistry&) = delete;

    // @throws std::runtime_error if the factory returns null, or whatever the factory throws
    ITranscriber& get(const TranscriberConfig& config);

    [[nodiscard]] bool contains(const TranscriberConfig& config) const;

private:
    struct Slot
    {
        std::once_flag once;
        std::unique_ptr<ITranscriber> transcriber;
    };

    Factory factory_;
    mutable std::mutex mutex_;
    std::map<TranscriberConfig, std::unique_ptr<Slot>> slots_;
};

} // namespace asr
