#include "vigil/clip_score_provider.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

#include <opencv2/imgproc.hpp>

namespace vigil {

namespace {
const cv::Scalar kClipMean(0.48145466, 0.4578275, 0.40821073);
const cv::Scalar kClipStd(0.26862954, 0.26130258, 0.27577711);

std::vector<float> flatten(const cv::Mat& out) {
    cv::Mat m = out.isContinuous() ? out : out.clone();
    if (m.depth() != CV_32F) m.convertTo(m, CV_32F);
    const float* p = m.ptr<float>();
    return std::vector<float>(p, p + m.total() * m.channels());
}

#ifdef VIGIL_USE_ONNXRUNTIME
std::size_t pick_embedding_output(const std::vector<std::string>& names) {
    for (std::size_t i = 0; i < names.size(); ++i) {
        if (names[i].find("embed") != std::string::npos) return i;
    }
    return 0;
}
#endif
}  // namespace

std::vector<float> l2_normalize(const std::vector<float>& v) {
    double norm = 0.0;
    for (float x : v) norm += static_cast<double>(x) * x;
    norm = std::sqrt(norm);
    std::vector<float> out(v);
    if (norm <= 0.0) return out;
    for (float& x : out) x = static_cast<float>(x / norm);
    return out;
}

ClipScoreProvider::ClipScoreProvider(const ClipModelConfig& cfg) : cfg_(cfg), use_ort_(cfg.use_ort) {
    try {
        tokenizer_ = std::make_unique<ClipTokenizer>(cfg_.vocab_path);
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] Could not load CLIP vocabulary: " << e.what() << std::endl;
        return;
    }

#ifdef VIGIL_USE_ONNXRUNTIME
    if (use_ort_) {
        try {
            load_ort();
            ready_ = true;
            std::cout << "[INFO] Loaded ORT CLIP encoders: " << cfg_.image_encoder_path
                      << ", " << cfg_.text_encoder_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[WARN] ONNX Runtime load failed (" << e.what() << "); falling back to OpenCV DNN." << std::endl;
            use_ort_ = false;
        }
    }
#else
    use_ort_ = false;
#endif

    if (!use_ort_) {
        try {
            load_opencv();
            ready_ = true;
            std::cout << "[INFO] Loaded OpenCV DNN CLIP encoders: " << cfg_.image_encoder_path
                      << ", " << cfg_.text_encoder_path << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[ERROR] Could not load CLIP encoders: " << e.what() << std::endl;
            ready_ = false;
        }
    }
}

void ClipScoreProvider::load_opencv() {
    image_net_ = cv::dnn::readNet(cfg_.image_encoder_path);
    text_net_ = cv::dnn::readNet(cfg_.text_encoder_path);
    for (cv::dnn::Net* net : {&image_net_, &text_net_}) {
        net->setPreferableBackend(cv::dnn::DNN_BACKEND_OPENCV);
        net->setPreferableTarget(cv::dnn::DNN_TARGET_CPU);
    }
}

#ifdef VIGIL_USE_ONNXRUNTIME
void ClipScoreProvider::open_ort_model(OrtModel& model, const std::string& path) {
    Ort::SessionOptions opts;
    opts.SetGraphOptimizationLevel(ORT_ENABLE_ALL);
#ifdef _WIN32
    std::wstring wpath(path.begin(), path.end());
    model.session = std::make_unique<Ort::Session>(env_, wpath.c_str(), opts);
#else
    model.session = std::make_unique<Ort::Session>(env_, path.c_str(), opts);
#endif

    Ort::AllocatorWithDefaultOptions allocator;
    for (size_t i = 0; i < model.session->GetInputCount(); ++i) {
        auto name = model.session->GetInputNameAllocated(i, allocator);
        model.input_name_strs.push_back(name.get());
    }
    for (size_t i = 0; i < model.session->GetOutputCount(); ++i) {
        auto name = model.session->GetOutputNameAllocated(i, allocator);
        model.output_name_strs.push_back(name.get());
    }
    if (model.input_name_strs.empty() || model.output_name_strs.empty()) {
        throw std::runtime_error("model has no inputs or outputs: " + path);
    }
    for (const auto& s : model.input_name_strs) model.input_names.push_back(s.c_str());
    model.output_names.push_back(model.output_name_strs[pick_embedding_output(model.output_name_strs)].c_str());
}

void ClipScoreProvider::load_ort() {
    open_ort_model(image_model_, cfg_.image_encoder_path);
    open_ort_model(text_model_, cfg_.text_encoder_path);
}

std::vector<float> ClipScoreProvider::run_ort_image(cv::Mat blob) {
    std::vector<int64_t> shape{1, 3, cfg_.image_size, cfg_.image_size};
    Ort::Value input = Ort::Value::CreateTensor<float>(mem_info_, blob.ptr<float>(), blob.total(),
                                                       shape.data(), shape.size());
    auto outputs = image_model_.session->Run(Ort::RunOptions{nullptr},
                                             image_model_.input_names.data(), &input, 1,
                                             image_model_.output_names.data(), 1);
    if (outputs.empty()) throw ScoringError("image encoder returned no output");
    const float* data = outputs.front().GetTensorData<float>();
    const size_t count = outputs.front().GetTensorTypeAndShapeInfo().GetElementCount();
    return std::vector<float>(data, data + count);
}

std::vector<float> ClipScoreProvider::run_ort_text(const std::vector<int64_t>& tokens) {
    std::vector<int64_t> ids(tokens);
    std::vector<int64_t> shape{1, static_cast<int64_t>(ids.size())};
    Ort::Value input = Ort::Value::CreateTensor<int64_t>(mem_info_, ids.data(), ids.size(),
                                                         shape.data(), shape.size());
    auto outputs = text_model_.session->Run(Ort::RunOptions{nullptr},
                                            text_model_.input_names.data(), &input, 1,
                                            text_model_.output_names.data(), 1);
    if (outputs.empty()) throw ScoringError("text encoder returned no output");
    const float* data = outputs.front().GetTensorData<float>();
    const size_t count = outputs.front().GetTensorTypeAndShapeInfo().GetElementCount();
    return std::vector<float>(data, data + count);
}
#endif

std::vector<float> ClipScoreProvider::run_opencv_image(cv::Mat blob) {
    image_net_.setInput(blob);
    return flatten(image_net_.forward());
}

std::vector<float> ClipScoreProvider::run_opencv_text(const std::vector<int64_t>& tokens) {
    cv::Mat ids(1, static_cast<int>(tokens.size()), CV_32S);
    for (size_t i = 0; i < tokens.size(); ++i) ids.at<int>(0, static_cast<int>(i)) = static_cast<int>(tokens[i]);
    text_net_.setInput(ids);
    return flatten(text_net_.forward());
}

cv::Mat ClipScoreProvider::preprocess(const cv::Mat& bgr, int image_size) {
    if (bgr.empty()) throw ScoringError("empty frame");
    cv::Mat color = bgr;
    if (bgr.channels() == 1) {
        cv::cvtColor(bgr, color, cv::COLOR_GRAY2BGR);
    } else if (bgr.channels() == 4) {
        cv::cvtColor(bgr, color, cv::COLOR_BGRA2BGR);
    }

    const double scale = static_cast<double>(image_size) / std::min(color.cols, color.rows);
    const int w = std::max(image_size, static_cast<int>(std::round(color.cols * scale)));
    const int h = std::max(image_size, static_cast<int>(std::round(color.rows * scale)));
    cv::Mat resized;
    cv::resize(color, resized, cv::Size(w, h), 0, 0, cv::INTER_CUBIC);
    cv::Mat crop = resized(cv::Rect((w - image_size) / 2, (h - image_size) / 2, image_size, image_size));

    cv::Mat rgb;
    cv::cvtColor(crop, rgb, cv::COLOR_BGR2RGB);
    rgb.convertTo(rgb, CV_32FC3, 1.0 / 255.0);
    cv::subtract(rgb, kClipMean, rgb);
    cv::divide(rgb, kClipStd, rgb);
    return cv::dnn::blobFromImage(rgb);
}

std::vector<float> ClipScoreProvider::image_embedding(const cv::Mat& blob) {
    std::lock_guard<std::mutex> lock(net_mu_);
#ifdef VIGIL_USE_ONNXRUNTIME
    if (use_ort_) return run_ort_image(blob);
#endif
    return run_opencv_image(blob);
}

std::vector<float> ClipScoreProvider::text_embedding(const std::string& prompt) {
    {
        std::lock_guard<std::mutex> lock(cache_mu_);
        auto it = text_cache_.find(prompt);
        if (it != text_cache_.end()) return it->second;
    }

    std::vector<float> embedding;
    {
        std::lock_guard<std::mutex> lock(net_mu_);
        const std::vector<int64_t> tokens = tokenizer_->encode(prompt);
#ifdef VIGIL_USE_ONNXRUNTIME
        if (use_ort_) {
            embedding = l2_normalize(run_ort_text(tokens));
        } else {
            embedding = l2_normalize(run_opencv_text(tokens));
        }
#else
        embedding = l2_normalize(run_opencv_text(tokens));
#endif
    }

    std::lock_guard<std::mutex> lock(cache_mu_);
    text_cache_[prompt] = embedding;
    return embedding;
}

ScoreBatch ClipScoreProvider::predict(const cv::Mat& image,
                                      const std::vector<std::string>& prompts,
                                      float temperature) {
    if (!ready_) throw ScoringError("CLIP encoders are not loaded");
    if (!(temperature > 0.0f)) throw ScoringError("temperature must be positive");

    const std::vector<float> image_vec = l2_normalize(image_embedding(preprocess(image, cfg_.image_size)));

    ScoreBatch batch;
    batch.raw_scores.reserve(prompts.size());
    for (const auto& prompt : prompts) {
        const std::vector<float> text_vec = text_embedding(prompt);
        if (text_vec.size() != image_vec.size()) {
            throw ScoringError("embedding size mismatch: image " + std::to_string(image_vec.size()) +
                               ", text " + std::to_string(text_vec.size()));
        }
        double dot = 0.0;
        for (size_t i = 0; i < image_vec.size(); ++i) dot += static_cast<double>(image_vec[i]) * text_vec[i];
        batch.raw_scores.push_back(static_cast<float>(dot / temperature));
    }

    for (double p : softmax(batch.raw_scores)) batch.probabilities.push_back(static_cast<float>(p));
    return batch;
}

std::map<std::string, std::string> ClipScoreProvider::describe() const {
    std::map<std::string, std::string> d;
    d["type"] = "clip";
    d["backend"] = use_ort_ ? "onnxruntime" : "opencv-dnn";
    d["image_encoder"] = cfg_.image_encoder_path;
    d["text_encoder"] = cfg_.text_encoder_path;
    d["image_size"] = std::to_string(cfg_.image_size);
    d["ready"] = ready_ ? "true" : "false";
    d["cached_prompts"] = std::to_string(cached_prompts());
    if (tokenizer_) d["vocab_size"] = std::to_string(tokenizer_->vocab_size());
    return d;
}

void ClipScoreProvider::forget(const std::vector<std::string>& prompts) {
    std::lock_guard<std::mutex> lock(cache_mu_);
    std::size_t dropped = 0;
    for (const auto& prompt : prompts) dropped += text_cache_.erase(prompt);
    if (dropped) std::cout << "[INFO] Dropped " << dropped << " cached text embedding(s)" << std::endl;
}

std::size_t ClipScoreProvider::cached_prompts() const {
    std::lock_guard<std::mutex> lock(cache_mu_);
    return text_cache_.size();
}

std::shared_ptr<ScoreProvider<cv::Mat>> make_score_provider(const ClipModelConfig& cfg) {
    return std::make_shared<ClipScoreProvider>(cfg);
}

}  // namespace vigil
