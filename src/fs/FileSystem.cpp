#include "FileSystem.hpp"

#include <utility>

namespace ossim {

FileSystem::FileSystem() : root_(std::make_unique<INode>()), current_(root_.get()) {
    root_->inode_id = 0;
    root_->name = "/";
    root_->is_directory = true;
}

Result<int> FileSystem::createFile(const std::string& name, const std::string& content) {
    return insert(name, false, content);
}

Result<int> FileSystem::createDirectory(const std::string& name) {
    return insert(name, true, "");
}

std::vector<DirectoryEntry> FileSystem::list() const {
    std::vector<DirectoryEntry> entries;
    entries.reserve(current_->children.size());
    for (const auto& child : current_->children) {
        const INode& node = *child.second;
        entries.push_back({node.name, node.is_directory, node.size(), node.inode_id});
    }
    return entries;
}

Result<std::string> FileSystem::readFile(const std::string& name) const {
    auto it = current_->children.find(name);
    if (it == current_->children.end()) {
        return Result<std::string>::failure(ErrorCode::NOT_FOUND, "file '" + name + "' not found");
    }
    if (it->second->is_directory) {
        return Result<std::string>::failure(ErrorCode::INVALID_ARGUMENT,
                                            "'" + name + "' is a directory");
    }
    return Result<std::string>::success(it->second->content);
}

Status FileSystem::changeDirectory(const std::string& name) {
    if (name == "..") {
        if (current_->parent) {
            current_ = current_->parent;
        }
        return Status::success();
    }
    auto it = current_->children.find(name);
    if (it == current_->children.end()) {
        return Status::failure(ErrorCode::NOT_FOUND, "directory '" + name + "' not found");
    }
    if (!it->second->is_directory) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "'" + name + "' is not a directory");
    }
    current_ = it->second.get();
    return Status::success();
}

std::string FileSystem::currentPath() const {
    if (current_ == root_.get()) {
        return "/";
    }
    std::string path;
    for (const INode* node = current_; node != root_.get(); node = node->parent) {
        path = "/" + node->name + path;
    }
    return path;
}

Status FileSystem::checkNewName(const std::string& name) const {
    if (name.empty() || name == "." || name == ".." || name.find('/') != std::string::npos) {
        return Status::failure(ErrorCode::INVALID_ARGUMENT, "invalid name '" + name + "'");
    }
    if (current_->children.count(name) != 0) {
        return Status::failure(ErrorCode::ALREADY_EXISTS, "'" + name + "' already exists");
    }
    return Status::success();
}

Result<int> FileSystem::insert(const std::string& name, bool isDirectory, const std::string& content) {
    Status status = checkNewName(name);
    if (!status.ok()) {
        return Result<int>::failure(status);
    }
    auto node = std::make_unique<INode>();
    node->inode_id = nextInode_++;
    node->name = name;
    node->is_directory = isDirectory;
    node->content = isDirectory ? std::string() : content;
    node->parent = current_;
    int id = node->inode_id;
    current_->children.emplace(name, std::move(node));
    return Result<int>::success(id);
}

} // namespace ossim
