#include "app/conversion_presenter.h"

#include "core/logger.h"

#include <variant>

namespace ngl::app {

namespace {
// Events applied per stream per tick, so one chatty job cannot starve the
// event loop.
constexpr int kMaxEventsPerTick = 256;
} // namespace

ConversionPresenter::ConversionPresenter(
    std::shared_ptr<ngl::core::ConversionEngine> engine,
    std::shared_ptr<ngl::core::JobRegistry> registry,
    std::shared_ptr<ngl::core::ILogger> logger, QObject *parent)
    : QObject(parent), engine_(std::move(engine)),
      registry_(std::move(registry)), logger_(std::move(logger)) {
  tick_timer_ = new QTimer(this);
  tick_timer_->setInterval(50); // 20 Hz
  connect(tick_timer_, &QTimer::timeout, this, &ConversionPresenter::onTick);
}

int ConversionPresenter::activeCount() const {
  return static_cast<int>(registry_->active_count());
}

QString ConversionPresenter::startConversion(const QString &itemId,
                                             const QString &filename,
                                             const QString &outputDir) {
  const ngl::core::JobKey key = itemId.trimmed().toStdString();
  if (key.empty()) {
    if (logger_) {
      logger_->warn("ui", "conversion_presenter", "start_rejected",
                    "empty item id");
    }
    return {};
  }

  ngl::core::ConversionRequest request;
  request.key = key;
  request.item_id = key;
  request.output_dir = outputDir.toStdString();
  request.desired_filename = filename.toStdString();

  // A restarted key replaces the live stream; the old generation's events
  // are dropped by the registry.
  auto ticket = registry_->begin(key);
  live_[key] = LiveJob{ticket, engine_->start(request)};

  emit activeCountChanged();
  emit jobUpdated(QString::fromStdString(key));
  if (!tick_timer_->isActive()) {
    tick_timer_->start();
  }
  return QString::fromStdString(key);
}

void ConversionPresenter::discardJob(const QString &key) {
  const auto k = key.toStdString();
  live_.erase(k);
  if (registry_->discard(k)) {
    emit activeCountChanged();
  }
}

double ConversionPresenter::progress(const QString &key) const {
  const auto state = registry_->snapshot(key.toStdString());
  if (!state || !state->progress) {
    return -1.0;
  }
  return *state->progress;
}

bool ConversionPresenter::isActive(const QString &key) const {
  const auto state = registry_->snapshot(key.toStdString());
  return state && state->is_active;
}

QString ConversionPresenter::lastMessage(const QString &key) const {
  const auto state = registry_->snapshot(key.toStdString());
  if (!state || !state->last_message) {
    return {};
  }
  return QString::fromStdString(*state->last_message);
}

QStringList ConversionPresenter::logLines(const QString &key) const {
  QStringList lines;
  const auto state = registry_->snapshot(key.toStdString());
  if (!state) {
    return lines;
  }
  for (const auto &line : state->log) {
    lines << QString::fromStdString(line);
  }
  return lines;
}

void ConversionPresenter::onTick() {
  for (auto it = live_.begin(); it != live_.end();) {
    LiveJob &job = it->second;
    const QString key = QString::fromStdString(it->first);
    bool updated = false;
    bool finished = false;

    for (int i = 0; i < kMaxEventsPerTick; ++i) {
      auto event = job.stream.try_next();
      if (!event) {
        break;
      }
      updated |= registry_->apply(job.ticket, *event);
      if (const auto *done = std::get_if<ngl::core::Completed>(&*event)) {
        finished = true;
        const bool ok = done->outcome.is_ok();
        emit jobCompleted(key, ok,
                          QString::fromStdString(
                              ok ? done->outcome.value()
                                 : done->outcome.error().message));
        break;
      }
    }

    if (updated) {
      emit jobUpdated(key);
    }
    if (finished || job.stream.finished()) {
      it = live_.erase(it);
      emit activeCountChanged();
    } else {
      ++it;
    }
  }

  if (live_.empty()) {
    tick_timer_->stop();
  }
}

} // namespace ngl::app
