#pragma once
#include <QFuture>
#include <QFutureWatcher>
#include <QObject>

// Calls done(result) on context's thread once future finishes. Nothing is
// called if context is destroyed first.
template <typename T, typename Fn>
void whenFinished(QObject* context, const QFuture<T>& future, Fn done) {
    auto* watcher = new QFutureWatcher<T>(context);
    QObject::connect(watcher, &QFutureWatcher<T>::finished, context, [watcher, done]() mutable {
        watcher->deleteLater();
        done(watcher->result());
    });
    watcher->setFuture(future);
}
