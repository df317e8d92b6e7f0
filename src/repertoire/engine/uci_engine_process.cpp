#include "repertoire/engine/uci_engine_process.hpp"

#include <iostream>
#include <sstream>

namespace repertoire::engine
{
  namespace
  {
    bool starts_with(const std::string &s, const char *pfx)
    {
      return s.rfind(pfx, 0) == 0;
    }
  } // namespace

  UciEngineProcess::~UciEngineProcess()
  {
    stop();
  }

  bool UciEngineProcess::start(const std::string &exePath)
  {
    stop();
    if (!platformStart(exePath))
      return false;

    m_eof.store(false);
    m_running.store(true);
    m_reader = std::thread([this]
                           { readerLoop(); });
    return true;
  }

  void UciEngineProcess::stop()
  {
    if (!m_running.exchange(false))
      return;

    // best-effort graceful shutdown
    sendLine("quit");
    platformStop();

    if (m_reader.joinable())
      m_reader.join();
    m_impl.reset();

    std::lock_guard lk(m_mtx);
    m_lines.clear();
  }

  void UciEngineProcess::sendLine(const std::string &line)
  {
    if (m_trace)
      std::cerr << "[UciEngine] > " << line << "\n";
    // UCI requires \n; many engines tolerate \r\n.
    if (!platformWrite(line + "\n") && m_trace)
      std::cerr << "[UciEngine] write failed\n";
  }

  void UciEngineProcess::readerLoop()
  {
    while (m_running.load())
    {
      std::string line;
      if (!platformReadLine(line))
        break;

      // Normalize CRLF
      while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();

      if (m_trace)
        std::cerr << "[UciEngine] < " << line << "\n";

      {
        std::lock_guard lk(m_mtx);
        m_lines.push_back(std::move(line));
      }
      m_cvLines.notify_all();
    }

    {
      std::lock_guard lk(m_mtx);
      m_eof.store(true);
    }
    m_cvLines.notify_all();
  }

  std::optional<std::string> UciEngineProcess::waitLine(std::chrono::steady_clock::time_point deadline)
  {
    std::unique_lock lk(m_mtx);
    m_cvLines.wait_until(lk, deadline, [&]
                         { return !m_lines.empty() || m_eof.load() || !m_running.load(); });
    if (m_lines.empty())
      return std::nullopt;
    std::string line = std::move(m_lines.front());
    m_lines.pop_front();
    return line;
  }

  bool UciEngineProcess::uciHandshake(Id &outId, std::chrono::milliseconds timeout)
  {
    outId = {};
    sendLine("uci");

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      auto line = waitLine(deadline);
      if (!line)
        return false;

      if (starts_with(*line, "id name "))
        outId.name = line->substr(std::string("id name ").size());
      else if (starts_with(*line, "id author "))
        outId.author = line->substr(std::string("id author ").size());
      else if (*line == "uciok")
        return waitReady();
    }
  }

  bool UciEngineProcess::waitReady(std::chrono::milliseconds timeout)
  {
    sendLine("isready");
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;)
    {
      auto line = waitLine(deadline);
      if (!line)
        return false;
      if (*line == "readyok")
        return true;
    }
  }

  void UciEngineProcess::setOption(const std::string &name, const std::string &value)
  {
    sendLine("setoption name " + name + " value " + value);
  }

  void UciEngineProcess::newGame()
  {
    sendLine("ucinewgame");
  }

  void UciEngineProcess::position(const analysis::PositionState &pos)
  {
    std::ostringstream os;
    if (pos.isStartpos())
      os << "position startpos";
    else
      os << "position fen " << pos.startFen;
    if (!pos.moves.empty())
    {
      os << " moves";
      for (auto &m : pos.moves)
        os << " " << m;
    }
    sendLine(os.str());
  }

  void UciEngineProcess::goFixedDepth(int depth)
  {
    std::ostringstream os;
    os << "go depth " << depth;
    sendLine(os.str());
  }

  void UciEngineProcess::stopSearch()
  {
    sendLine("stop");
  }

} // namespace repertoire::engine
