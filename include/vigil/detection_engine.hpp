#pragma once

#include <exception>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "vigil/decision_core.hpp"
#include "vigil/score_provider.hpp"

namespace vigil {

// Binds the decision core to one scoring backend. One instance per stream.
template <typename Image>
class DetectionEngine : public DecisionCore {
public:
    DetectionEngine(ScenarioStore& store,
                    std::shared_ptr<ScoreProvider<Image>> provider,
                    float temperature = 1.0f)
        : DecisionCore(store, temperature), provider_(std::move(provider)) {}

    // Blocking; one batched provider call per frame. Provider failures come
    // back as a result with error set, never as a detection.
    DetectionResult detect(const Image& image, double timestamp_sec) {
        FrameBatch batch = begin_frame(timestamp_sec);
        if (batch.empty()) return finish_frame(batch, {});
        if (!provider_ || !provider_->ready()) return fail_frame(batch, "score provider is not ready");

        ScoreBatch scores;
        try {
            scores = provider_->predict(image, batch.prompts(), batch.temperature());
        } catch (const std::exception& e) {
            return fail_frame(batch, e.what());
        }
        return finish_frame(batch, scores.raw_scores);
    }

    std::vector<DetectionResult> batch_detect(const std::vector<Image>& images, double timestamp_sec) {
        std::vector<DetectionResult> results;
        results.reserve(images.size());
        for (const auto& image : images) results.push_back(detect(image, timestamp_sec));
        return results;
    }

    DetectorInfo info() const {
        DetectorInfo i = core_info();
        if (provider_) i.model = provider_->describe();
        return i;
    }

    const std::shared_ptr<ScoreProvider<Image>>& provider() const { return provider_; }

protected:
    void prompts_retired(const std::vector<std::string>& prompts) override {
        if (provider_) provider_->forget(prompts);
    }

private:
    std::shared_ptr<ScoreProvider<Image>> provider_;
};

}  // namespace vigil
