#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include <opencv2/core.hpp>
#include <opencv2/dnn.hpp>

#include "vigil/clip_tokenizer.hpp"
#include "vigil/score_provider.hpp"

#ifdef VIGIL_USE_ONNXRUNTIME
#include <onnxruntime_cxx_api.h>
#endif

namespace vigil {

struct ClipModelConfig {
    std::string image_encoder_path;
    std::string text_encoder_path;
    std::string vocab_path;
    int image_size{224};
    bool use_ort{true};
};

// CLIP-style scorer: image and text encoders exported to ONNX, cosine
// similarity between L2-normalised embeddings divided by the temperature.
class ClipScoreProvider : public ScoreProvider<cv::Mat> {
public:
    explicit ClipScoreProvider(const ClipModelConfig& cfg);

    bool ready() const override { return ready_; }

    ScoreBatch predict(const cv::Mat& image,
                       const std::vector<std::string>& prompts,
                       float temperature) override;

    std::map<std::string, std::string> describe() const override;

    // Text embeddings are cached per prompt until the prompt is retired.
    void forget(const std::vector<std::string>& prompts) override;
    std::size_t cached_prompts() const;

    // Resize shortest side, center crop, RGB, CLIP mean/std. Returns a 1x3xSxS blob.
    static cv::Mat preprocess(const cv::Mat& bgr, int image_size);

private:
    std::vector<float> image_embedding(const cv::Mat& blob);
    std::vector<float> text_embedding(const std::string& prompt);
    std::vector<float> run_opencv_image(cv::Mat blob);
    std::vector<float> run_opencv_text(const std::vector<int64_t>& tokens);
#ifdef VIGIL_USE_ONNXRUNTIME
    void load_ort();
    std::vector<float> run_ort_image(cv::Mat blob);
    std::vector<float> run_ort_text(const std::vector<int64_t>& tokens);
#endif
    void load_opencv();

    ClipModelConfig cfg_;
    bool ready_{false};
    bool use_ort_{false};
    std::unique_ptr<ClipTokenizer> tokenizer_;

    cv::dnn::Net image_net_;
    cv::dnn::Net text_net_;
    std::mutex net_mu_;   // cv::dnn::Net is not reentrant

    mutable std::mutex cache_mu_;
    std::unordered_map<std::string, std::vector<float>> text_cache_;

#ifdef VIGIL_USE_ONNXRUNTIME
    struct OrtModel {
        std::unique_ptr<Ort::Session> session;
        std::vector<std::string> input_name_strs;
        std::vector<const char*> input_names;
        std::vector<std::string> output_name_strs;
        std::vector<const char*> output_names;   // the embedding output only
    };
    void open_ort_model(OrtModel& model, const std::string& path);

    Ort::Env env_{ORT_LOGGING_LEVEL_WARNING, "vigil"};
    Ort::MemoryInfo mem_info_{Ort::MemoryInfo::CreateCpu(OrtDeviceAllocator, OrtMemTypeCPU)};
    OrtModel image_model_;
    OrtModel text_model_;
#endif
};

// Builds the configured provider. Never null; check ready() before use.
std::shared_ptr<ScoreProvider<cv::Mat>> make_score_provider(const ClipModelConfig& cfg);

// Unit-length copy; a zero vector stays zero.
std::vector<float> l2_normalize(const std::vector<float>& v);

}  // namespace vigil
