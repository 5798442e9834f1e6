#ifndef UTIL_FILE_HPP
#define UTIL_FILE_HPP

#include <string>
#include <system_error>

namespace util {

class File {
 public:
  // Creates all the folders that are needed to write the specified file
  // or, if path is a directory, creates all the folders.
  static void MakeDirs(const std::string& path);

  // Recursively removes a tree.
  static void RemoveTree(const std::string& path);

  // Joins two paths. If second is absolute, it is returned unchanged.
  static std::string JoinPath(const std::string& first,
                              const std::string& second);

  // Computes the file name for a path, ignoring trailing separators like the
  // basename utility does. BaseName("/a/b/") == "b", BaseName("/") == "/".
  static std::string BaseName(const std::string& path);

  // Removes the text starting at the last '.' of name, if any.
  // StripExtension("foo.cfg") == "foo", StripExtension("foo") == "foo".
  static std::string StripExtension(const std::string& name);

  // Returns true if a file exists
  static bool Exists(const std::string& path);

  // Returns true if path is a regular file the current user can execute.
  static bool IsExecutable(const std::string& path);
};

// Creates a temporary directory in a given folder. The folder will be
// (recursively) removed on destruction.
class TempDir {
 public:
  // base is the directory in which the temporary directory will be created.
  explicit TempDir(const std::string& base);

  // Returns the path of the temporary folder.
  const std::string& Path() const;

  // Disables automatic deletion of the folder.
  void Keep();

  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;
  TempDir(TempDir&&) = delete;
  TempDir& operator=(TempDir&&) = delete;

 private:
  std::string path_;
  bool keep_ = false;
};

}  // namespace util

#endif
