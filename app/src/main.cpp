#include "app/conversion_presenter.h"
#include "app/transfer_presenter.h"
#include "core/candidate.h"
#include "core/conversion_engine.h"
#include "core/job_registry.h"
#include "core/logger.h"
#include "infra/config.h"
#include "infra/logger.h"
#include "infra/path_service.h"
#include "infra/posix_process.h"

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <string>
#include <system_error>

namespace {

volatile std::sig_atomic_t g_interrupted = 0;

void on_signal(int) { g_interrupted = 1; }

void print_line(const QString &text) {
  std::fputs(text.toLocal8Bit().constData(), stdout);
  std::fputc('\n', stdout);
  std::fflush(stdout);
}

int run_convert(QCoreApplication &qtapp, const QStringList &args,
                const QString &name_opt, const QString &dir_opt,
                const ngl::infra::AppConfig &config,
                const std::shared_ptr<ngl::core::ILogger> &logger) {
  if (args.size() < 2) {
    print_line("usage: nightingale convert <item-id> [--name N] [--dir D]");
    return 2;
  }
  const QString item_id = args.at(1);
  const QString filename =
      name_opt.isEmpty() ? QString::fromStdString(ngl::core::clean_filename(
                               item_id.toStdString()))
                         : name_opt;
  const QString output_dir =
      dir_opt.isEmpty() ? QString::fromStdString(config.output_dir) : dir_opt;

  std::error_code ec;
  std::filesystem::create_directories(output_dir.toStdString(), ec);
  if (ec) {
    logger->warn("startup", "app", "output_dir", ec.message());
  }

  auto engine = std::make_shared<ngl::core::ConversionEngine>(
      std::make_shared<ngl::infra::PosixProcessLauncher>(),
      config.conversion_options(), logger);
  auto registry =
      std::make_shared<ngl::core::JobRegistry>(config.log_retention);
  auto *presenter =
      new ngl::app::ConversionPresenter(engine, registry, logger, &qtapp);

  int last_percent = -1;
  QObject::connect(presenter, &ngl::app::ConversionPresenter::jobUpdated,
                   [presenter, &last_percent](const QString &key) {
                     const double p = presenter->progress(key);
                     if (p >= 0 && static_cast<int>(p) != last_percent) {
                       last_percent = static_cast<int>(p);
                       print_line(QString("%1: %2%").arg(key).arg(last_percent));
                     }
                   });
  int exit_code = 0;
  QObject::connect(
      presenter, &ngl::app::ConversionPresenter::jobCompleted,
      [&qtapp, presenter, &exit_code](const QString &key, bool ok,
                                      const QString &) {
        print_line(presenter->lastMessage(key));
        exit_code = ok ? 0 : 1;
        qtapp.quit();
      });

  if (presenter->startConversion(item_id, filename, output_dir).isEmpty()) {
    return 2;
  }
  qtapp.exec();
  engine->wait_idle();
  return exit_code;
}

int run_share(QCoreApplication &qtapp, const QStringList &args,
              const ngl::infra::AppConfig &config,
              const std::shared_ptr<ngl::core::ILogger> &logger) {
  if (args.size() < 2) {
    print_line("usage: nightingale share <file>");
    return 2;
  }

  ngl::infra::TransferOptions options;
  options.route_host = config.route_host;
  auto *presenter = new ngl::app::TransferPresenter(logger, options, &qtapp);
  if (!presenter->share(args.at(1))) {
    print_line("Error: " + presenter->errorText());
    return 1;
  }

  if (!presenter->url().isEmpty()) {
    print_line(presenter->displayCode());
    print_line("Open " + presenter->url() + " on a device on the same network.");
  } else {
    print_line("Serving on port " + QString::number(presenter->port()) +
               " (no LAN address: " + presenter->errorText() + ")");
  }
  print_line("Press Ctrl+C to stop sharing.");

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);
  auto *watch = new QTimer(&qtapp);
  QObject::connect(watch, &QTimer::timeout, [&qtapp, presenter]() {
    if (g_interrupted != 0 || !presenter->running()) {
      qtapp.quit();
    }
  });
  watch->start(200);

  qtapp.exec();
  presenter->stop();
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  QCoreApplication qtapp(argc, argv);
  QCoreApplication::setApplicationName("nightingale");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Audio conversion jobs and local file sharing.");
  parser.addHelpOption();
  parser.addPositionalArgument("command", "convert | share");
  parser.addPositionalArgument("target", "Item id (convert) or file (share)");
  const QCommandLineOption name_option(
      "name", "Output filename without extension.", "name");
  const QCommandLineOption dir_option("dir", "Output directory.", "dir");
  parser.addOption(name_option);
  parser.addOption(dir_option);
  parser.process(qtapp);

  auto logger = ngl::infra::create_console_logger_from_env();
  auto paths = ngl::infra::PathService::create();
  const auto config = ngl::infra::AppConfig::from_environment(*paths, logger);

  const QStringList args = parser.positionalArguments();
  const QString command = args.isEmpty() ? QString() : args.first();
  if (command == "convert") {
    return run_convert(qtapp, args, parser.value(name_option),
                       parser.value(dir_option), config, logger);
  }
  if (command == "share") {
    return run_share(qtapp, args, config, logger);
  }
  parser.showHelp(2);
}
