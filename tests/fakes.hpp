/*
 * engram - In-process providers for tests
 */
#ifndef ENGRAM_TESTS_FAKES_HPP
#define ENGRAM_TESTS_FAKES_HPP

#include <engram/embedding/provider.hpp>
#include <engram/classifier/classifier.hpp>
#include <engram/core/utils.hpp>
#include <map>
#include <mutex>
#include <condition_variable>
#include <atomic>

// Deterministic bag-of-words embedder. Each word adds 1 to a hashed bucket;
// pinned texts return a fixed vector instead.
class FakeEmbedder : public engram::EmbeddingProvider {
public:
    explicit FakeEmbedder(int dim = 256)
        : dim_(dim), failing_(false), blocked_(false), calls_(0) {}

    std::string name() const override { return "fake"; }
    std::string model() const override { return "bag-of-words"; }
    int dimension() const override { return dim_; }

    engram::EmbeddingResult embed(const std::string& text) override {
        ++calls_;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            gate_.wait(lock, [this] { return !blocked_; });
            if (failing_) {
                return engram::EmbeddingResult::fail("fake embedder offline");
            }
            std::map<std::string, std::vector<float> >::const_iterator it = pinned_.find(text);
            if (it != pinned_.end()) {
                return engram::EmbeddingResult::ok(it->second);
            }
        }

        std::vector<float> v(dim_, 0.0f);
        std::vector<std::string> words = engram::tokenize_words(text);
        for (size_t i = 0; i < words.size(); ++i) {
            uint32_t h = 2166136261u;
            for (size_t j = 0; j < words[i].size(); ++j) {
                h ^= static_cast<unsigned char>(words[i][j]);
                h *= 16777619u;
            }
            v[h % dim_] += 1.0f;
        }
        return engram::EmbeddingResult::ok(v);
    }

    // Fixed vector for an exact text; padded with zeros to the dimension
    void pin(const std::string& text, const std::vector<float>& head) {
        std::vector<float> v(dim_, 0.0f);
        for (size_t i = 0; i < head.size() && i < v.size(); ++i) v[i] = head[i];
        std::lock_guard<std::mutex> lock(mutex_);
        pinned_[text] = v;
    }

    void set_failing(bool failing) {
        std::lock_guard<std::mutex> lock(mutex_);
        failing_ = failing;
    }

    // While blocked, embed() waits until release()
    void block() {
        std::lock_guard<std::mutex> lock(mutex_);
        blocked_ = true;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            blocked_ = false;
        }
        gate_.notify_all();
    }

    int calls() const { return calls_.load(); }

private:
    int dim_;
    std::mutex mutex_;
    std::condition_variable gate_;
    std::map<std::string, std::vector<float> > pinned_;
    bool failing_;
    bool blocked_;
    std::atomic<int> calls_;
};

// Scripted classifier
class FakeClassifier : public engram::MemoryClassifier {
public:
    FakeClassifier()
        : category(engram::MemoryCategory::PREFERENCE)
        , classify_fails(false)
        , judge_fails(false)
        , action(engram::JudgeAction::NEW)
        , classify_calls(0)
        , judge_calls(0)
    {}

    std::string name() const override { return "fake-classifier"; }

    engram::ClassifyResult classify(const std::string&) override {
        ++classify_calls;
        if (classify_fails) return engram::ClassifyResult::fail("classifier offline");
        return engram::ClassifyResult::ok(category, 0.9);
    }

    engram::JudgeResult judge(const std::string&,
                              const std::vector<engram::JudgeCandidate>& existing) override {
        ++judge_calls;
        last_existing = existing;
        if (judge_fails) return engram::JudgeResult::fail("judge offline");
        return engram::JudgeResult::ok(action, target, reason);
    }

    engram::MemoryCategory category;
    bool classify_fails;
    bool judge_fails;
    engram::JudgeAction action;
    std::string target;
    std::string reason;
    int classify_calls;
    int judge_calls;
    std::vector<engram::JudgeCandidate> last_existing;
};

#endif // ENGRAM_TESTS_FAKES_HPP
