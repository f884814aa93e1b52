// Location of the single retained snapshot per (project, environment).
#pragma once
#include <string>

namespace opendeploy {

// Layout: <appDir>/backups/<project>/<environment>/<mirrored tree>.
class BackupStore {
public:
    explicit BackupStore(std::string appDir);

    const std::string& appDir() const { return appDir_; }

    // Pure path computation; does not validate or touch the disk.
    std::string pathFor(const std::string& project, const std::string& env) const;

    // Resolve the snapshot directory, creating the full path if absent.
    bool locationFor(const std::string& project,
                     const std::string& env,
                     std::string& out,
                     std::string& err) const;

    // Presence check without creating anything.
    bool exists(const std::string& project, const std::string& env) const;

    // A new snapshot is written into a staging directory beside the live one
    // (<project>/.<env>.staging) and only replaces it on commit, so a failed
    // capture never touches the retained snapshot.
    //
    // Create an empty staging directory, dropping leftovers of an earlier run.
    bool beginStaging(const std::string& project,
                      const std::string& env,
                      std::string& out,
                      std::string& err) const;
    // Swap the staged tree in as the live snapshot.
    bool commitStaging(const std::string& project, const std::string& env, std::string& err) const;
    // Best effort removal of the staging directory.
    void discardStaging(const std::string& project, const std::string& env) const;

    // Project and environment become path components: a plain name that does
    // not start with '.' (those are reserved for staging).
    static bool validName(const std::string& name);

private:
    std::string appDir_;

    bool checkNames(const std::string& project, const std::string& env, std::string& err) const;
    std::string siblingFor(const std::string& project, const std::string& env, const char* suffix) const;
};

} // namespace opendeploy
