#pragma once

#include "core/event_channel.h"
#include "core/job.h"
#include "core/process.h"
#include "core/task_group.h"

#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace ngl::core {

class ILogger;

/// Engine-wide settings for building the yt-dlp command line.
struct ConversionOptions {
  std::string tool_path = "yt-dlp";
  std::optional<std::string> ffmpeg_location; // directory holding ffmpeg
  std::string audio_format = "mp3";
  int extractor_retries = 5;
  int fragment_retries = 5;
  std::string source_url_prefix = "https://www.youtube.com/watch?v=";
};

/// One user-initiated conversion. Output directory and filename come from
/// the settings collaborator; the item id from search.
struct ConversionRequest {
  JobKey key;
  std::string item_id;
  std::string output_dir;
  std::string desired_filename; // without extension
};

/// Consuming end of one job's event stream.
///
/// Yields zero or more ProgressUpdate/LogLine events and then exactly one
/// Completed, after which every read returns std::nullopt.
class JobStream {
public:
  JobStream() = default;
  JobStream(JobKey key, EventChannel<JobEvent>::Receiver receiver)
      : key_(std::move(key)), receiver_(std::move(receiver)) {}

  [[nodiscard]] const JobKey &key() const { return key_; }

  /// Block until the next event or end of stream.
  std::optional<JobEvent> next() { return receiver_.recv(); }

  /// Never blocks; std::nullopt when nothing is pending.
  std::optional<JobEvent> try_next() { return receiver_.try_recv(); }

  template <typename Rep, typename Period>
  std::optional<JobEvent> next_for(std::chrono::duration<Rep, Period> timeout) {
    return receiver_.recv_for(timeout);
  }

  /// True once Completed has been read and the producers are gone.
  [[nodiscard]] bool finished() const { return receiver_.is_drained(); }

private:
  JobKey key_;
  EventChannel<JobEvent>::Receiver receiver_;
};

/// ConversionEngine — runs one external extraction process per job.
///
/// start() returns immediately. A supervisor task spawns the process, runs
/// two drain tasks (stdout, stderr) that feed the job's channel, waits for
/// the exit status once both drains finish, then sends Completed.
///
/// No retries and no cancellation: a failed job is restarted with a new
/// start() call, and starting a key again does not stop the older process.
///
/// The destructor blocks until every running job has finished, since there
/// is no way to abort a process once started. An owner that must not block
/// on teardown (a UI thread, say) keeps the engine alive until wait_idle()
/// returns or active_jobs() is zero.
class ConversionEngine {
public:
  ConversionEngine(std::shared_ptr<IProcessLauncher> launcher,
                   ConversionOptions options,
                   std::shared_ptr<ILogger> logger = nullptr);
  /// Joins every supervisor; blocks while a process is still running.
  ~ConversionEngine();

  ConversionEngine(const ConversionEngine &) = delete;
  ConversionEngine &operator=(const ConversionEngine &) = delete;

  JobStream start(const ConversionRequest &request);

  /// Block until every job started so far has sent Completed.
  void wait_idle();

  /// Jobs whose supervisor has not returned yet.
  [[nodiscard]] std::size_t active_jobs() const;

  [[nodiscard]] const ConversionOptions &options() const { return options_; }

  /// Full argument vector for a request (program excluded).
  [[nodiscard]] static ProcessSpec build_command(const ConversionRequest &request,
                                                 const ConversionOptions &options);

  /// Source URL for an item id; ids that already are URLs pass through.
  [[nodiscard]] static std::string source_url(const std::string &item_id,
                                              const ConversionOptions &options);

private:
  using Sender = EventChannel<JobEvent>::Sender;

  void run_job(const ConversionRequest &request, Sender tx);
  void drain(const JobKey &key, ILineReader &reader, OutputStream stream,
             Sender tx);

  std::shared_ptr<IProcessLauncher> launcher_;
  ConversionOptions options_;
  std::shared_ptr<ILogger> logger_;
  TaskGroup supervisors_;
};

} // namespace ngl::core
