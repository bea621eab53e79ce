#pragma once

#include "prdguard/common/http.hpp"
#include "prdguard/config/schema.hpp"
#include "prdguard/observability/observer.hpp"
#include "prdguard/security/threat_scanner.hpp"
#include "prdguard/storage/file_backend.hpp"

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace prdguard::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;
  [[nodiscard]] std::optional<std::string> read_file(const std::string &name) const;
  /// Relative names of every regular file whose name contains `fragment`.
  [[nodiscard]] std::vector<std::string> files_containing(const std::string &fragment) const;

private:
  std::filesystem::path path_;
};

/// Strict defaults rooted at the workspace, logging off, heuristic scanner.
config::Config temp_config(const TempWorkspace &workspace);
/// Same shape for tests that never touch disk.
config::Config memory_config(const std::string &root = "/ws");

/// In-memory host with fault injection. Faults match any path containing the fragment.
class FakeFileBackend final : public storage::IFileBackend {
public:
  [[nodiscard]] common::Result<std::optional<std::string>> read(const std::string &path) override;
  [[nodiscard]] common::Status write(const std::string &path, const std::string &bytes) override;
  [[nodiscard]] common::Status remove(const std::string &path) override;
  [[nodiscard]] common::Status replace(const std::string &path, const std::string &old_text,
                                       const std::string &new_text, bool replace_all) override;
  [[nodiscard]] bool supports_rename() const override { return rename_supported; }
  [[nodiscard]] common::Status rename(const std::string &from, const std::string &to) override;
  [[nodiscard]] std::string_view name() const override { return "fake"; }

  [[nodiscard]] bool exists(const std::string &path) const { return files.contains(path); }
  [[nodiscard]] std::vector<std::string> paths_containing(const std::string &fragment) const;

  std::map<std::string, std::string> files;
  std::vector<std::string> calls;
  bool rename_supported = false;

  std::optional<std::string> fail_write;
  std::optional<std::string> fail_read;
  std::optional<std::string> fail_remove;
  std::optional<std::string> fail_rename;
  std::optional<std::string> fail_replace;
  std::optional<std::string> throw_on_write;
  /// Reads of matching paths return the stored bytes with one byte flipped.
  std::optional<std::string> corrupt_read;
  /// The next write to exactly this path stores only the first half of the bytes and then
  /// fails. The fault clears after firing once.
  std::optional<std::string> truncate_write;
  /// Replace succeeds but leaves the file untouched.
  bool ignore_replace = false;

private:
  [[nodiscard]] static bool matches(const std::optional<std::string> &fault,
                                    const std::string &path);
};

class FakeThreatScanner final : public security::IThreatScanner {
public:
  enum class Mode { Safe, Unsafe, Fail, Throw, Slow };

  explicit FakeThreatScanner(Mode mode = Mode::Safe) : mode(mode) {}

  [[nodiscard]] common::Result<security::ScanResult> scan(const std::string &text) override;
  [[nodiscard]] std::string_view name() const override { return "fake"; }

  Mode mode;
  std::vector<std::string> threats = {"prompt_injection"};
  std::chrono::milliseconds delay{120};
  std::size_t calls = 0;
};

class FakeHttpClient final : public common::HttpClient {
public:
  [[nodiscard]] common::HttpResponse
  post_json(const std::string &url, const std::unordered_map<std::string, std::string> &headers,
            const std::string &body, std::uint64_t timeout_ms) override;

  common::HttpResponse response;
  std::string last_url;
  std::string last_body;
  std::unordered_map<std::string, std::string> last_headers;
  std::uint64_t last_timeout_ms = 0;
};

struct CapturedTelemetry {
  std::vector<observability::ObserverEvent> events;
  std::vector<observability::ObserverMetric> metrics;

  template <typename T> [[nodiscard]] std::size_t count_events() const {
    std::size_t n = 0;
    for (const auto &event : events) {
      n += std::holds_alternative<T>(event) ? 1 : 0;
    }
    return n;
  }
};

class CapturingObserver final : public observability::IObserver {
public:
  explicit CapturingObserver(std::shared_ptr<CapturedTelemetry> state) : state_(std::move(state)) {}

  void record_event(const observability::ObserverEvent &event) override {
    state_->events.push_back(event);
  }
  void record_metric(const observability::ObserverMetric &metric) override {
    state_->metrics.push_back(metric);
  }
  [[nodiscard]] std::string_view name() const override { return "capturing"; }

private:
  std::shared_ptr<CapturedTelemetry> state_;
};

/// Observer whose every call throws, standing in for a broken log sink.
class ThrowingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &) override {
    throw std::runtime_error("log sink down");
  }
  void record_metric(const observability::ObserverMetric &) override {
    throw std::runtime_error("log sink down");
  }
  [[nodiscard]] std::string_view name() const override { return "throwing"; }
};

} // namespace prdguard::testing
