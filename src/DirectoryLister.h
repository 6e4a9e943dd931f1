#pragma once

#include <QString>

#include "OpError.h"
#include "SshTypes.h"
#include "CancelToken.h"

class SessionRegistry;

// Remote directory enumeration over one SFTP channel per call.
//
// list():          one level, "." and ".." omitted, directories first then
//                  by name.
// listRecursive(): depth-first, every entry tagged with its path relative to
//                  the listed root. Real subdirectories are walked first;
//                  symlinks into directories inside the root subtree are
//                  followed afterwards, and only when the real walk never
//                  reached their target (their entries come last). An
//                  unreadable subdirectory gets an error marker and one
//                  ListingError; the walk goes on. Depth and entry count
//                  are bounded (truncated is set when the entry cap hits).
class DirectoryLister
{
public:
    DirectoryLister(SessionRegistry* registry, int maxDepth, int maxEntries);

    bool list(const QString& connectionId, const QString& remotePath,
              DirectoryListing* out, OpError* err);

    bool listRecursive(const QString& connectionId, const QString& remotePath,
                       DirectoryListing* out, OpError* err,
                       const CancelToken* cancel = nullptr);

private:
    SessionRegistry* m_registry;
    int m_maxDepth;
    int m_maxEntries;
};
