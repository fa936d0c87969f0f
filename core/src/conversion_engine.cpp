#include "core/conversion_engine.h"

#include "core/candidate.h"
#include "core/logger.h"
#include "core/progress_parser.h"

#include <filesystem>
#include <sstream>
#include <utility>

namespace ngl::core {

namespace {

constexpr const char *kComponent = "conversion_engine";

std::string describe_exit(const ExitStatus &status) {
  if (status.exited && status.code) {
    return std::to_string(*status.code);
  }
  if (status.signal) {
    return "unknown (signal " + std::to_string(*status.signal) + ")";
  }
  return "unknown";
}

std::string join_command(const ProcessSpec &spec) {
  std::ostringstream oss;
  oss << spec.program;
  for (const auto &arg : spec.args) {
    oss << ' ' << arg;
  }
  return oss.str();
}

} // namespace

ConversionEngine::ConversionEngine(std::shared_ptr<IProcessLauncher> launcher,
                                   ConversionOptions options,
                                   std::shared_ptr<ILogger> logger)
    : launcher_(std::move(launcher)), options_(std::move(options)),
      logger_(std::move(logger)) {}

ConversionEngine::~ConversionEngine() { supervisors_.wait_all(); }

std::string ConversionEngine::source_url(const std::string &item_id,
                                         const ConversionOptions &options) {
  if (is_watch_url(item_id)) {
    return item_id;
  }
  return options.source_url_prefix + item_id;
}

ProcessSpec ConversionEngine::build_command(const ConversionRequest &request,
                                            const ConversionOptions &options) {
  const std::string filename = sanitize_filename(request.desired_filename);
  const std::string output_template =
      (std::filesystem::path(request.output_dir) / (filename + ".%(ext)s"))
          .string();

  ProcessSpec spec;
  spec.program = options.tool_path;
  spec.working_dir = request.output_dir;
  spec.args = {"-x", "--audio-format", options.audio_format, "--no-playlist",
               "--verbose"};
  if (options.ffmpeg_location && !options.ffmpeg_location->empty()) {
    spec.args.push_back("--ffmpeg-location");
    spec.args.push_back(*options.ffmpeg_location);
  }
  spec.args.insert(spec.args.end(),
                   {"--extractor-retries",
                    std::to_string(options.extractor_retries),
                    "--fragment-retries",
                    std::to_string(options.fragment_retries), "--newline",
                    "--progress-template", std::string(kProgressTemplate), "-o",
                    output_template, source_url(request.item_id, options)});
  return spec;
}

JobStream ConversionEngine::start(const ConversionRequest &request) {
  supervisors_.reap_finished();

  auto channel = EventChannel<JobEvent>::create();
  Sender tx = std::move(channel.first);
  JobStream stream(request.key, std::move(channel.second));

  if (logger_) {
    logger_->info(request.key, kComponent, "job_start",
                  "item=" + request.item_id + " dir=" + request.output_dir +
                      " filename=" + request.desired_filename);
  }

  supervisors_.spawn([this, request, tx]() mutable {
    run_job(request, std::move(tx));
  });
  return stream;
}

void ConversionEngine::wait_idle() { supervisors_.wait_all(); }

std::size_t ConversionEngine::active_jobs() const {
  return supervisors_.running();
}

void ConversionEngine::run_job(const ConversionRequest &request, Sender tx) {
  const auto fail = [&](Error error) {
    if (logger_) {
      logger_->error(request.key, kComponent, "job_failed",
                     std::string(to_string(error.kind)) + ": " + error.message);
    }
    tx.send(Completed{Result<std::string, Error>::Err(std::move(error))});
  };

  if (request.output_dir.empty()) {
    fail(Error::InvalidArgument("No output directory configured"));
    return;
  }
  if (sanitize_filename(request.desired_filename).empty()) {
    fail(Error::InvalidArgument("Output filename is empty"));
    return;
  }

  const ProcessSpec spec = build_command(request, options_);
  if (logger_) {
    logger_->debug(request.key, kComponent, "job_command", join_command(spec));
  }

  auto spawned = launcher_
                     ? launcher_->spawn(spec)
                     : Result<std::unique_ptr<IProcessHandle>, Error>::Err(
                           Error::Internal("No process launcher configured"));
  if (spawned.is_err()) {
    fail(std::move(spawned).error());
    return;
  }
  std::unique_ptr<IProcessHandle> process = std::move(spawned).value();

  {
    TaskGroup drains;
    std::shared_ptr<ILineReader> err_reader(process->take_stderr());
    std::shared_ptr<ILineReader> out_reader(process->take_stdout());
    if (err_reader) {
      drains.spawn([this, key = request.key, err_reader, tx]() {
        drain(key, *err_reader, OutputStream::Stderr, tx);
      });
    }
    if (out_reader) {
      drains.spawn([this, key = request.key, out_reader, tx]() {
        drain(key, *out_reader, OutputStream::Stdout, tx);
      });
    }
    drains.wait_all();
  }

  auto waited = process->wait();
  if (waited.is_err()) {
    fail(std::move(waited).error());
    return;
  }

  const ExitStatus status = waited.value();
  if (!status.success()) {
    const std::string exit_text = describe_exit(status);
    Error error(ErrorKind::ProcessExit, status.code.value_or(-1),
                "yt-dlp failed with exit code: " + exit_text +
                    ". Check logs for details.",
                {{"exit_code", exit_text}});
    fail(std::move(error));
    return;
  }

  std::string summary = "Downloaded successfully to " + request.output_dir;
  if (logger_) {
    logger_->info(request.key, kComponent, "job_succeeded", summary);
  }
  tx.send(Completed{Result<std::string, Error>::Ok(std::move(summary))});
}

void ConversionEngine::drain(const JobKey &key, ILineReader &reader,
                             OutputStream stream, Sender tx) {
  std::size_t lines = 0;
  while (true) {
    auto next = reader.read_line();
    if (next.is_err()) {
      // Read errors end this drain only; the exit status decides the job.
      if (logger_) {
        logger_->warn(key, kComponent, "drain_read_error",
                      std::string(to_string(stream)) + ": " +
                          next.error().message);
      }
      break;
    }
    const auto &line = next.value();
    if (!line) {
      break;
    }
    ++lines;

    std::optional<double> progress;
    if (stream == OutputStream::Stdout) {
      progress = parse_progress_line(*line);
    }
    tx.send(LogLine{*line, stream});
    if (progress) {
      tx.send(ProgressUpdate{*progress});
    }
  }

  if (logger_) {
    logger_->debug(key, kComponent, "drain_finished",
                   std::string(to_string(stream)) +
                       " lines=" + std::to_string(lines));
  }
}

} // namespace ngl::core
