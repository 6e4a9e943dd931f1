#pragma once

#include <QString>
#include <functional>

#include "OpError.h"
#include "SshTypes.h"
#include "CancelToken.h"

class SessionRegistry;

// In-progress upload/download. Lives for the duration of one call.
struct TransferTask
{
    TransferDirection direction = TransferDirection::Upload;
    QString source;
    QString destination;
    QString writePath;          // destination, or destination + tempSuffix in atomic mode
    quint64 bytesDone = 0;
    quint64 totalBytes = 0;
    bool    totalKnown = false;
};

/*
    TransferEngine
    --------------
    Chunked SFTP upload/download, one channel per transfer.

    - Never loads a whole file: reads and writes chunkBytes at a time.
    - progress is called after every chunk.
    - cancel is observed between chunks only.
    - Non-atomic: destination written in place, left partial on failure or
      cancellation. Atomic: written to <dest><tempSuffix>, renamed over
      dest on success, temp removed on failure.
    - Failure after data started flowing => TransferError with bytesDone.
      Cancellation => CancelledError with bytesDone. No retries.

    Blocking: call from a worker thread.
*/
class TransferEngine
{
public:
    using ProgressFn = std::function<void(const TransferTask& task)>;

    struct Options
    {
        int     chunkBytes = 64 * 1024;
        QString tempSuffix = ".shelldeck.part";
    };

    TransferEngine(SessionRegistry* registry, const Options& opts);

    bool upload(const QString& connectionId,
                const QString& localPath,
                const QString& remotePath,
                bool atomic,
                TransferResult* out,
                OpError* err,
                const ProgressFn& progress = nullptr,
                const CancelToken* cancel = nullptr);

    bool download(const QString& connectionId,
                  const QString& remotePath,
                  const QString& localPath,
                  bool atomic,
                  TransferResult* out,
                  OpError* err,
                  const ProgressFn& progress = nullptr,
                  const CancelToken* cancel = nullptr);

private:
    SessionRegistry* m_registry;
    Options m_opts;
};
