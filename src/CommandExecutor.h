#pragma once

#include <QString>
#include <QByteArray>
#include <functional>

#include "OpError.h"
#include "SshTypes.h"
#include "CancelToken.h"

class SessionRegistry;

/*
    CommandExecutor
    ---------------
    Runs one remote command on its own exec channel of a registered session.

    - Output is appended as it arrives. With a sink, chunks are forwarded
      and not retained; without one, buffered output is capped at
      maxBufferedBytes and the result is flagged truncated.
    - timeoutMs bounds the whole call. On timeout the channel is closed and
      TimeoutError is returned; the remote process may keep running (the
      protocol gives no reliable way to kill it).
    - A non-zero exit code is a successful result.
    - Concurrent calls on one session each get their own channel.

    Blocking: call from a worker thread.
*/
class CommandExecutor
{
public:
    using OutputSink = std::function<void(const QByteArray& chunk, bool isStderr)>;

    CommandExecutor(SessionRegistry* registry, int maxBufferedBytes, int auditMode);

    bool execute(const QString& connectionId,
                 const QString& command,
                 int timeoutMs,
                 CommandResult* out,
                 OpError* err,
                 const OutputSink& sink = nullptr,
                 const CancelToken* cancel = nullptr);

private:
    SessionRegistry* m_registry;
    int m_maxBuffered;
    int m_auditMode;
};
