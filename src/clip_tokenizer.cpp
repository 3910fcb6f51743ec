#include "vigil/clip_tokenizer.hpp"

#include <cctype>
#include <fstream>
#include <limits>
#include <stdexcept>

namespace vigil {

namespace {

const char* kStartOfText = "<|startoftext|>";
const char* kEndOfText = "<|endoftext|>";

// Merges used by the released CLIP vocabulary: 49152 - 256 - 2.
constexpr std::size_t kMaxMerges = 48894;

std::string utf8(uint32_t cp) {
    std::string out;
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
    return out;
}

// Length in bytes of the utf-8 sequence starting at s[i]; 1 for stray bytes.
std::size_t utf8_length(const std::string& s, std::size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    std::size_t n = 1;
    if ((c & 0xE0) == 0xC0) n = 2;
    else if ((c & 0xF0) == 0xE0) n = 3;
    else if ((c & 0xF8) == 0xF0) n = 4;
    if (i + n > s.size()) return 1;
    for (std::size_t k = 1; k < n; ++k) {
        if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) return 1;
    }
    return n;
}

enum class CharClass { SPACE, LETTER, DIGIT, OTHER };

CharClass classify(const std::string& s, std::size_t i) {
    const unsigned char c = static_cast<unsigned char>(s[i]);
    if (c >= 0x80) return CharClass::LETTER;
    if (std::isspace(c)) return CharClass::SPACE;
    if (std::isalpha(c)) return CharClass::LETTER;
    if (std::isdigit(c)) return CharClass::DIGIT;
    return CharClass::OTHER;
}

std::string clean(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    bool pending_space = false;
    for (char ch : text) {
        const unsigned char c = static_cast<unsigned char>(ch);
        if (c < 0x80 && std::isspace(c)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) out.push_back(' ');
        pending_space = false;
        out.push_back(c < 0x80 ? static_cast<char>(std::tolower(c)) : ch);
    }
    return out;
}

bool starts_with(const std::string& s, std::size_t pos, const std::string& prefix) {
    return s.compare(pos, prefix.size(), prefix) == 0;
}

std::vector<std::string> pre_tokenize(const std::string& text) {
    static const char* contractions[] = {"'s", "'t", "'re", "'ve", "'m", "'ll", "'d"};
    std::vector<std::string> pieces;
    std::size_t i = 0;
    while (i < text.size()) {
        if (starts_with(text, i, kStartOfText) || starts_with(text, i, kEndOfText)) {
            const std::string special = starts_with(text, i, kStartOfText) ? kStartOfText : kEndOfText;
            pieces.push_back(special);
            i += special.size();
            continue;
        }
        if (text[i] == '\'') {
            bool matched = false;
            for (const char* c : contractions) {
                if (starts_with(text, i, c)) {
                    pieces.emplace_back(c);
                    i += std::char_traits<char>::length(c);
                    matched = true;
                    break;
                }
            }
            if (matched) continue;
        }

        const CharClass cls = classify(text, i);
        if (cls == CharClass::SPACE) {
            ++i;
            continue;
        }
        if (cls == CharClass::DIGIT) {
            pieces.push_back(text.substr(i, 1));
            ++i;
            continue;
        }
        const std::size_t start = i;
        while (i < text.size() && classify(text, i) == cls) {
            i += utf8_length(text, i);
        }
        pieces.push_back(text.substr(start, i - start));
    }
    return pieces;
}

}  // namespace

ClipTokenizer::ClipTokenizer(const std::string& merges_path, std::size_t context_length)
    : context_length_(context_length < 2 ? 2 : context_length), byte_encoder_(256) {
    std::vector<int> bs;
    for (int b = '!'; b <= '~'; ++b) bs.push_back(b);
    for (int b = 0xA1; b <= 0xAC; ++b) bs.push_back(b);
    for (int b = 0xAE; b <= 0xFF; ++b) bs.push_back(b);
    std::vector<uint32_t> cs(bs.begin(), bs.end());
    std::vector<bool> printable(256, false);
    for (int b : bs) printable[b] = true;
    uint32_t n = 0;
    for (int b = 0; b < 256; ++b) {
        if (printable[b]) continue;
        bs.push_back(b);
        cs.push_back(256 + n++);
    }

    std::vector<std::string> vocab;
    vocab.reserve(512 + kMaxMerges + 2);
    for (std::size_t k = 0; k < bs.size(); ++k) {
        byte_encoder_[bs[k]] = utf8(cs[k]);
        vocab.push_back(byte_encoder_[bs[k]]);
    }
    for (std::size_t k = 0; k < bs.size(); ++k) vocab.push_back(vocab[k] + "</w>");

    std::ifstream f(merges_path);
    if (!f) throw std::runtime_error("unable to open CLIP merges file: " + merges_path);
    std::string line;
    std::getline(f, line);  // version header
    while (bpe_ranks_.size() < kMaxMerges && std::getline(f, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        const auto space = line.find(' ');
        if (space == std::string::npos || space == 0 || space + 1 >= line.size()) continue;
        auto pair = std::make_pair(line.substr(0, space), line.substr(space + 1));
        if (bpe_ranks_.count(pair)) continue;
        const std::size_t rank = bpe_ranks_.size();
        bpe_ranks_.emplace(pair, rank);
        vocab.push_back(pair.first + pair.second);
    }
    if (bpe_ranks_.empty()) throw std::runtime_error("no BPE merges in " + merges_path);

    vocab.push_back(kStartOfText);
    vocab.push_back(kEndOfText);
    for (std::size_t k = 0; k < vocab.size(); ++k) {
        encoder_.emplace(vocab[k], static_cast<int64_t>(k));
    }
    sot_ = encoder_.at(kStartOfText);
    eot_ = encoder_.at(kEndOfText);
}

const std::vector<std::string>& ClipTokenizer::bpe(const std::string& token) {
    auto cached = cache_.find(token);
    if (cached != cache_.end()) return cached->second;

    std::vector<std::string> word;
    for (unsigned char c : token) word.push_back(byte_encoder_[c]);
    if (word.empty()) return cache_[token];
    word.back() += "</w>";

    while (word.size() > 1) {
        std::size_t best_rank = std::numeric_limits<std::size_t>::max();
        std::pair<std::string, std::string> best;
        for (std::size_t i = 0; i + 1 < word.size(); ++i) {
            auto it = bpe_ranks_.find(std::make_pair(word[i], word[i + 1]));
            if (it != bpe_ranks_.end() && it->second < best_rank) {
                best_rank = it->second;
                best = it->first;
            }
        }
        if (best_rank == std::numeric_limits<std::size_t>::max()) break;

        std::vector<std::string> merged;
        merged.reserve(word.size());
        for (std::size_t i = 0; i < word.size();) {
            if (i + 1 < word.size() && word[i] == best.first && word[i + 1] == best.second) {
                merged.push_back(best.first + best.second);
                i += 2;
            } else {
                merged.push_back(word[i]);
                ++i;
            }
        }
        word.swap(merged);
    }
    return cache_.emplace(token, std::move(word)).first->second;
}

std::vector<int64_t> ClipTokenizer::tokenize(const std::string& text) {
    std::vector<int64_t> ids;
    for (const auto& piece : pre_tokenize(clean(text))) {
        if (piece == kStartOfText || piece == kEndOfText) {
            ids.push_back(encoder_.at(piece));
            continue;
        }
        for (const auto& symbol : bpe(piece)) {
            auto it = encoder_.find(symbol);
            if (it != encoder_.end()) ids.push_back(it->second);
        }
    }
    return ids;
}

std::vector<int64_t> ClipTokenizer::encode(const std::string& text) {
    std::vector<int64_t> tokens;
    tokens.reserve(context_length_);
    tokens.push_back(sot_);
    for (int64_t id : tokenize(text)) tokens.push_back(id);
    tokens.push_back(eot_);
    if (tokens.size() > context_length_) {
        tokens.resize(context_length_);
        tokens.back() = eot_;
    }
    tokens.resize(context_length_, 0);
    return tokens;
}

}  // namespace vigil
