#pragma once

#include "core/conversion_engine.h"
#include "core/job_registry.h"

#include <QObject>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <map>
#include <memory>

namespace ngl::core {
class ILogger;
} // namespace ngl::core

namespace ngl::app {

/// ConversionPresenter — QObject bridge between the UI and ConversionEngine.
///
/// Streams are drained on the Qt thread by a 50 ms tick into the
/// JobRegistry; UI reads go through the registry snapshots.
class ConversionPresenter : public QObject {
  Q_OBJECT

  Q_PROPERTY(int activeCount READ activeCount NOTIFY activeCountChanged)

public:
  ConversionPresenter(std::shared_ptr<ngl::core::ConversionEngine> engine,
                      std::shared_ptr<ngl::core::JobRegistry> registry,
                      std::shared_ptr<ngl::core::ILogger> logger,
                      QObject *parent = nullptr);

  [[nodiscard]] int activeCount() const;

  /// Starts a job keyed by the item id and returns the key.
  Q_INVOKABLE QString startConversion(const QString &itemId,
                                      const QString &filename,
                                      const QString &outputDir);
  Q_INVOKABLE void discardJob(const QString &key);

  /// -1 when the job is unknown or has no progress to show.
  Q_INVOKABLE double progress(const QString &key) const;
  Q_INVOKABLE bool isActive(const QString &key) const;
  Q_INVOKABLE QString lastMessage(const QString &key) const;
  Q_INVOKABLE QStringList logLines(const QString &key) const;

signals:
  void activeCountChanged();
  void jobUpdated(const QString &key);
  void jobCompleted(const QString &key, bool success, const QString &message);

private slots:
  void onTick();

private:
  struct LiveJob {
    ngl::core::JobTicket ticket;
    ngl::core::JobStream stream;
  };

  std::shared_ptr<ngl::core::ConversionEngine> engine_;
  std::shared_ptr<ngl::core::JobRegistry> registry_;
  std::shared_ptr<ngl::core::ILogger> logger_;

  QTimer *tick_timer_;
  std::map<ngl::core::JobKey, LiveJob> live_;
};

} // namespace ngl::app
