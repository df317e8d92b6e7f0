#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "repertoire/analysis/analysis_types.hpp"

namespace repertoire::engine
{
  class UciEngineProcess
  {
  public:
    struct Id
    {
      std::string name, author;
    };

    UciEngineProcess() = default;
    ~UciEngineProcess();

    UciEngineProcess(const UciEngineProcess &) = delete;
    UciEngineProcess &operator=(const UciEngineProcess &) = delete;
    UciEngineProcess(UciEngineProcess &&) = delete;
    UciEngineProcess &operator=(UciEngineProcess &&) = delete;

    bool start(const std::string &exePath);
    void stop();
    bool running() const { return m_running.load() && !m_eof.load(); }

    bool uciHandshake(Id &outId, std::chrono::milliseconds timeout = std::chrono::seconds(3));
    bool waitReady(std::chrono::milliseconds timeout = std::chrono::seconds(2));

    void setOption(const std::string &name, const std::string &value);
    void newGame();

    void position(const analysis::PositionState &pos);
    void goFixedDepth(int depth);
    void stopSearch();

    // Next output line, or nullopt on timeout / engine exit.
    std::optional<std::string> waitLine(std::chrono::steady_clock::time_point deadline);

    void setTrace(bool on) { m_trace = on; }

  private:
    void sendLine(const std::string &line);
    void readerLoop();

    bool platformStart(const std::string &exePath);
    void platformStop();

    bool platformWrite(const std::string &s);
    bool platformReadLine(std::string &outLine);

  private:
    std::thread m_reader;
    std::atomic_bool m_running{false};
    std::atomic_bool m_eof{false};
    bool m_trace{false};

    std::mutex m_mtx;
    std::condition_variable m_cvLines;

    std::deque<std::string> m_lines;

    struct Impl;

    struct ImplDeleter
    {
      void operator()(Impl *p) noexcept; // defined in platform .cpp where Impl is complete
    };

    std::unique_ptr<Impl, ImplDeleter> m_impl;
  };

} // namespace repertoire::engine
