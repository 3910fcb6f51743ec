#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace vigil {

// Byte-level BPE tokenizer compatible with the CLIP text encoder.
// Loads the uncompressed merges file (bpe_simple_vocab_16e6.txt).
class ClipTokenizer {
public:
    static constexpr std::size_t kContextLength = 77;

    // Throws std::runtime_error if the merges file cannot be read.
    explicit ClipTokenizer(const std::string& merges_path,
                           std::size_t context_length = kContextLength);

    // Fixed-length token ids: start token, BPE ids, end token, zero padding.
    // Over-long prompts are truncated and still end with the end token.
    std::vector<int64_t> encode(const std::string& text);

    // BPE ids only, no start/end tokens or padding.
    std::vector<int64_t> tokenize(const std::string& text);

    int64_t start_token() const { return sot_; }
    int64_t end_token() const { return eot_; }
    std::size_t vocab_size() const { return encoder_.size(); }
    std::size_t context_length() const { return context_length_; }

private:
    const std::vector<std::string>& bpe(const std::string& token);

    std::size_t context_length_;
    std::vector<std::string> byte_encoder_;                 // byte -> utf-8 symbol
    std::unordered_map<std::string, int64_t> encoder_;
    std::map<std::pair<std::string, std::string>, std::size_t> bpe_ranks_;
    std::unordered_map<std::string, std::vector<std::string>> cache_;
    int64_t sot_{0};
    int64_t eot_{0};
};

}  // namespace vigil
