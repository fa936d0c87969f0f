#include "app/transfer_presenter.h"

#include "core/logger.h"

namespace ngl::app {

TransferPresenter::TransferPresenter(std::shared_ptr<ngl::core::ILogger> logger,
                                     ngl::infra::TransferOptions options,
                                     QObject *parent)
    : QObject(parent), logger_(std::move(logger)),
      options_(std::move(options)) {}

TransferPresenter::~TransferPresenter() = default;

bool TransferPresenter::running() const {
  return service_ && service_->is_running();
}

int TransferPresenter::port() const {
  return service_ ? static_cast<int>(service_->port()) : 0;
}

bool TransferPresenter::share(const QString &path) {
  stop();

  auto created =
      ngl::infra::TransferService::create(path.toStdString(), logger_, options_);
  if (created.is_err()) {
    setError(QString::fromStdString(created.error().message));
    return false;
  }
  service_ = std::move(created).value();

  auto started = service_->start();
  if (started.is_err()) {
    setError(QString::fromStdString(started.error().message));
    service_.reset();
    return false;
  }
  emit runningChanged();

  // The server is already reachable on the port; a missing LAN address
  // only costs the URL and code.
  auto url = service_->get_url();
  auto code = service_->generate_display_code();
  if (url.is_err()) {
    setError(QString::fromStdString(url.error().message));
    setUrl({}, {});
    return true;
  }
  setUrl(QString::fromStdString(url.value()),
         code.is_ok() ? QString::fromStdString(code.value()) : QString());
  setError(code.is_ok() ? QString()
                        : QString::fromStdString(code.error().message));
  return true;
}

void TransferPresenter::stop() {
  if (!service_) {
    return;
  }
  service_->stop();
  service_->wait();
  service_.reset();
  setUrl({}, {});
  emit runningChanged();
}

void TransferPresenter::setError(const QString &text) {
  if (error_text_ != text) {
    error_text_ = text;
    emit errorTextChanged();
  }
  if (!text.isEmpty() && logger_) {
    logger_->warn("ui", "transfer_presenter", "share_error",
                  text.toStdString());
  }
}

void TransferPresenter::setUrl(const QString &url, const QString &code) {
  if (url_ != url) {
    url_ = url;
    emit urlChanged();
  }
  if (display_code_ != code) {
    display_code_ = code;
    emit displayCodeChanged();
  }
}

} // namespace ngl::app
