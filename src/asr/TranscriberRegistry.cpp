#include "TranscriberRegistry.hpp"

#include <plog/Log.h>
#include <stdexcept>

namespace asr
{

TranscriberRegistry::TranscriberRegistry(Factory factory)
    : factory_(std::move(factory))
{
}

TranscriberRegistry::~TranscriberRegistry() = default;

ITranscriber& TranscriberRegistry::get(const TranscriberConfig& config)
{
    Slot* slot = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto& entry = slots_[config];
        if (!entry)
            entry = std::make_unique<Slot>();
        slot = entry.get();
    }

    // Built outside the map lock, other configurations stay reachable meanwhile
    std::call_once(slot->once,
                   [&]()
                   {
                       PLOG_INFO << "Loading transcriber model=" << config.model << " device=" << config.device
                                 << " accuracy_mode=" << config.accuracy_mode;
                       auto transcriber = factory_(config);
                       if (!transcriber)
                           throw std::runtime_error("Transcriber factory returned null for model " + config.model);
                       std::lock_guard<std::mutex> lock(mutex_);
                       slot->transcriber = std::move(transcriber);
                   });

    return *slot->transcriber;
}

bool TranscriberRegistry::contains(const TranscriberConfig& config) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(config);
    return it != slots_.end() && it->second->transcriber != nullptr;
}

} // namespace asr
