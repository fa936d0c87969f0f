#pragma once

#include "infra/transfer_service.h"

#include <QObject>
#include <QString>

#include <memory>

namespace ngl::core {
class ILogger;
} // namespace ngl::core

namespace ngl::app {

/// Drives one TransferService at a time for the "share to phone" panel.
class TransferPresenter : public QObject {
  Q_OBJECT

  Q_PROPERTY(QString url READ url NOTIFY urlChanged)
  Q_PROPERTY(QString displayCode READ displayCode NOTIFY displayCodeChanged)
  Q_PROPERTY(bool running READ running NOTIFY runningChanged)
  Q_PROPERTY(QString errorText READ errorText NOTIFY errorTextChanged)

public:
  explicit TransferPresenter(std::shared_ptr<ngl::core::ILogger> logger,
                             ngl::infra::TransferOptions options = {},
                             QObject *parent = nullptr);
  ~TransferPresenter() override;

  [[nodiscard]] QString url() const { return url_; }
  [[nodiscard]] QString displayCode() const { return display_code_; }
  [[nodiscard]] bool running() const;
  [[nodiscard]] QString errorText() const { return error_text_; }
  [[nodiscard]] int port() const;

  /// Stops any current share, then serves `path`. Returns false and sets
  /// errorText on failure.
  Q_INVOKABLE bool share(const QString &path);
  Q_INVOKABLE void stop();

signals:
  void urlChanged();
  void displayCodeChanged();
  void runningChanged();
  void errorTextChanged();

private:
  void setError(const QString &text);
  void setUrl(const QString &url, const QString &code);

  std::shared_ptr<ngl::core::ILogger> logger_;
  ngl::infra::TransferOptions options_;
  std::unique_ptr<ngl::infra::TransferService> service_;

  QString url_;
  QString display_code_;
  QString error_text_;
};

} // namespace ngl::app
