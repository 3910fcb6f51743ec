#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace vigil {

struct ScoreBatch {
    std::vector<float> raw_scores;      // one per prompt, input order
    std::vector<float> probabilities;   // provider's own softmax over the same prompts
};

// Raised when a vision-language backend cannot score a frame.
class ScoringError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Vision-language similarity backend. One implementation per model runtime,
// chosen once when the pipeline is built.
template <typename Image>
class ScoreProvider {
public:
    virtual ~ScoreProvider() = default;

    virtual bool ready() const = 0;

    // Must return exactly prompts.size() raw scores in prompt order, or throw.
    virtual ScoreBatch predict(const Image& image,
                               const std::vector<std::string>& prompts,
                               float temperature) = 0;

    virtual std::map<std::string, std::string> describe() const { return {}; }

    // Prompts no scenario uses any more; providers may drop what they cached for them.
    virtual void forget(const std::vector<std::string>& prompts) { (void)prompts; }
};

// Numerically stable softmax, computed in double precision.
std::vector<double> softmax(const std::vector<float>& scores);

}  // namespace vigil
