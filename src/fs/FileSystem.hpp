#ifndef OSSIM_FILE_SYSTEM_HPP
#define OSSIM_FILE_SYSTEM_HPP

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>

#include "core/Result.hpp"

namespace ossim {

struct INode {
    int inode_id{0};
    std::string name;
    bool is_directory{false};
    std::string content;                                   // files only
    std::map<std::string, std::unique_ptr<INode>> children; // directories only
    INode* parent{nullptr};

    std::size_t size() const { return content.size(); }
};

struct DirectoryEntry {
    std::string name;
    bool is_directory{false};
    std::size_t size{0};
    int inode_id{0};
};

/**
 * In-memory directory tree with a current-directory cursor. All name
 * arguments are single path components relative to the cursor.
 */
class FileSystem {
public:
    FileSystem();

    FileSystem(const FileSystem&) = delete;
    FileSystem& operator=(const FileSystem&) = delete;

    Result<int> createFile(const std::string& name, const std::string& content = "");
    Result<int> createDirectory(const std::string& name);

    /** Entries of the current directory, ordered by name. */
    std::vector<DirectoryEntry> list() const;

    Result<std::string> readFile(const std::string& name) const;

    /** Enter a child directory, or the parent for "..". */
    Status changeDirectory(const std::string& name);

    std::string currentPath() const;

private:
    Status checkNewName(const std::string& name) const;
    Result<int> insert(const std::string& name, bool isDirectory, const std::string& content);

    std::unique_ptr<INode> root_;
    INode* current_;
    int nextInode_{1};
};

} // namespace ossim

#endif // OSSIM_FILE_SYSTEM_HPP
