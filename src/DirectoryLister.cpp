// DirectoryLister.cpp
#include "DirectoryLister.h"

#include <QSet>
#include <QElapsedTimer>
#include <QDebug>

#include <algorithm>

#include "SessionRegistry.h"

static void sortEntries(QVector<DirectoryEntry>* v)
{
    std::sort(v->begin(), v->end(), [](const DirectoryEntry& a, const DirectoryEntry& b) {
        const bool ad = (a.kind == EntryKind::Directory);
        const bool bd = (b.kind == EntryKind::Directory);
        if (ad != bd) return ad;
        return a.name < b.name;
    });
}

static QString joinRel(const QString& rel, const QString& name)
{
    return rel.isEmpty() ? name : rel + "/" + name;
}

static bool isInside(const QString& root, const QString& path)
{
    if (path == root) return true;
    const QString prefix = root.endsWith('/') ? root : root + "/";
    return path.startsWith(prefix);
}

namespace {

struct PendingLink
{
    int     index = -1;    // the link's entry in out->entries
    QString target;        // canonical directory it points at
    int     depth = 0;     // depth of the link entry itself
};

struct Walk
{
    SftpChannel*         sftp = nullptr;
    const CancelToken*   cancel = nullptr;
    QString              rootReal;
    int                  maxDepth = 0;
    int                  maxEntries = 0;
    QSet<QString>        visited;
    QVector<PendingLink> pending;   // followed only after the real tree is walked
    DirectoryListing*    out = nullptr;
    OpError              fatal;     // set => abort the whole walk
};

bool fatalError(const OpError& e)
{
    return e.code == ErrorCode::ConnectionLost || e.code == ErrorCode::Cancelled;
}

void recordSubError(Walk& w, int entryIndex, const QString& message)
{
    DirectoryEntry& e = w.out->entries[entryIndex];
    e.error = message;

    ListingError le;
    le.path = e.fullPath;
    le.relativePath = e.relativePath;
    le.message = message;
    w.out->errors.push_back(le);
}

bool walk(Walk& w, QVector<DirectoryEntry> items, const QString& rel, int depth);

// Reads the directory behind entry `index` (canonical `realDir`) and walks it.
// Returns false when the walk must stop.
bool descend(Walk& w, int index, const QString& realDir, int depth)
{
    if (w.visited.contains(realDir))
        return true;

    if (depth + 1 > w.maxDepth) {
        recordSubError(w, index, QStringLiteral("Maximum depth %1 reached; not descended.").arg(w.maxDepth));
        return true;
    }

    w.visited.insert(realDir);

    // Read through the entry's own path so fullPath stays under the listed root.
    const QString fullPath = w.out->entries[index].fullPath;
    const QString rel = w.out->entries[index].relativePath;

    QVector<DirectoryEntry> children;
    OpError re;
    if (!w.sftp->readDir(fullPath, &children, &re)) {
        if (fatalError(re)) { w.fatal = re; return false; }
        qWarning().noquote() << QString("[SFTP] cannot read %1: %2").arg(fullPath, re.message);
        recordSubError(w, index, re.message);
        return true;
    }

    return walk(w, children, rel, depth + 1);
}

// Appends `items` (children of a directory at `rel`) and descends into real
// subdirectories. Symlinks to directories are queued in w.pending.
// Returns false when the walk must stop (fatal error or entry cap).
bool walk(Walk& w, QVector<DirectoryEntry> items, const QString& rel, int depth)
{
    sortEntries(&items);

    for (DirectoryEntry& item : items) {
        if (w.cancel && w.cancel->isCancelled()) {
            setError(&w.fatal, ErrorCode::Cancelled, QStringLiteral("Listing cancelled."));
            return false;
        }

        if (w.out->entries.size() >= w.maxEntries) {
            w.out->truncated = true;
            return false;
        }

        item.relativePath = joinRel(rel, item.name);

        QString realDir;
        QString linkTarget;
        OpError e;

        if (item.kind == EntryKind::Directory) {
            if (!w.sftp->realPath(item.fullPath, &realDir, &e)) {
                if (fatalError(e)) { w.fatal = e; return false; }
                realDir = item.fullPath;
            }
        } else if (item.kind == EntryKind::Symlink) {
            QString target;
            if (w.sftp->realPath(item.fullPath, &target, &e)) {
                item.linkTarget = target;

                DirectoryEntry st;
                OpError se;
                if (w.sftp->stat(target, &st, &se)) {
                    if (st.kind == EntryKind::Directory && isInside(w.rootReal, target))
                        linkTarget = target;
                } else if (fatalError(se)) {
                    w.fatal = se;
                    return false;
                }
            } else if (fatalError(e)) {
                w.fatal = e;
                return false;
            }
            // dangling link: reported as a plain symlink
        }

        w.out->entries.push_back(item);
        const int index = w.out->entries.size() - 1;

        if (!linkTarget.isEmpty()) {
            PendingLink p;
            p.index = index;
            p.target = linkTarget;
            p.depth = depth;
            w.pending.push_back(p);
            continue;
        }

        if (!realDir.isEmpty() && !descend(w, index, realDir, depth))
            return false;
    }
    return true;
}

// Follows queued links whose target the real walk never reached. Links found
// while doing so are appended to the queue and handled in turn.
void followPendingLinks(Walk& w)
{
    for (int i = 0; i < w.pending.size(); ++i) {
        if (w.cancel && w.cancel->isCancelled()) {
            setError(&w.fatal, ErrorCode::Cancelled, QStringLiteral("Listing cancelled."));
            return;
        }
        const PendingLink p = w.pending[i];
        if (!descend(w, p.index, p.target, p.depth))
            return;
    }
}

} // namespace

DirectoryLister::DirectoryLister(SessionRegistry* registry, int maxDepth, int maxEntries)
    : m_registry(registry)
    , m_maxDepth(qMax(1, maxDepth))
    , m_maxEntries(qMax(1, maxEntries))
{
}

bool DirectoryLister::list(const QString& connectionId, const QString& remotePath,
                           DirectoryListing* out, OpError* err)
{
    if (out) *out = DirectoryListing{};

    QSharedPointer<TransportSession> session = m_registry->lookup(connectionId, err);
    if (!session)
        return false;

    OpError localErr;
    ChannelLease lease(session.data(), &localErr);
    if (!lease.acquired()) {
        if (err) *err = localErr;
        return false;
    }

    std::unique_ptr<SftpChannel> sftp = session->transport()->openSftp(&localErr);
    if (!sftp) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }

    DirectoryListing result;
    result.path = remotePath;
    if (!sftp->readDir(remotePath, &result.entries, &localErr)) {
        session->reportFault(localErr);
        qWarning().noquote() << QString("[SFTP] list %1 failed: %2").arg(remotePath, localErr.message);
        if (err) *err = localErr;
        return false;
    }

    sortEntries(&result.entries);
    session->touch();

    qDebug().noquote() << QString("[SFTP] list %1 -> %2 entries").arg(remotePath).arg(result.entries.size());

    if (out) *out = result;
    return true;
}

bool DirectoryLister::listRecursive(const QString& connectionId, const QString& remotePath,
                                    DirectoryListing* out, OpError* err,
                                    const CancelToken* cancel)
{
    if (out) *out = DirectoryListing{};

    QSharedPointer<TransportSession> session = m_registry->lookup(connectionId, err);
    if (!session)
        return false;

    OpError localErr;
    ChannelLease lease(session.data(), &localErr, cancel);
    if (!lease.acquired()) {
        if (err) *err = localErr;
        return false;
    }

    std::unique_ptr<SftpChannel> sftp = session->transport()->openSftp(&localErr);
    if (!sftp) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }

    QElapsedTimer timer;
    timer.start();

    DirectoryListing result;
    result.path = remotePath;

    Walk w;
    w.sftp       = sftp.get();
    w.cancel     = cancel;
    w.maxDepth   = m_maxDepth;
    w.maxEntries = m_maxEntries;
    w.out        = &result;

    if (!sftp->realPath(remotePath, &w.rootReal, &localErr)) {
        session->reportFault(localErr);
        if (err) *err = localErr;
        return false;
    }
    w.visited.insert(w.rootReal);

    // The root itself must be readable; failures below it are partial.
    QVector<DirectoryEntry> top;
    if (!sftp->readDir(remotePath, &top, &localErr)) {
        session->reportFault(localErr);
        qWarning().noquote() << QString("[SFTP] listRecursive %1 failed: %2").arg(remotePath, localErr.message);
        if (err) *err = localErr;
        return false;
    }

    if (walk(w, top, QString(), 0))
        followPendingLinks(w);

    if (w.fatal.isSet()) {
        session->reportFault(w.fatal);
        qWarning().noquote() << QString("[SFTP] listRecursive %1 aborted after %2 entries: %3")
                                .arg(remotePath).arg(result.entries.size()).arg(w.fatal.message);
        if (err) *err = w.fatal;
        return false;
    }

    session->touch();

    qInfo().noquote() << QString("[SFTP] listRecursive %1 -> %2 entries, %3 error(s)%4 in %5 ms")
                         .arg(remotePath).arg(result.entries.size()).arg(result.errors.size())
                         .arg(result.truncated ? ", truncated" : "")
                         .arg(timer.elapsed());

    if (out) *out = result;
    return true;
}
