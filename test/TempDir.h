#pragma once

#include <fstream>
#include <iterator>
#include <stdlib.h>
#include <string>
#include <unistd.h>

/*
  TempDir

  Scratch directory for file based tests, removed (with its files) on
  destruction.
*/

class TempDir {
public:
  TempDir() {
    char tmpl[] = "/tmp/rover_test_XXXXXX";
    const char* p = mkdtemp(tmpl);
    _path = p ? p : "/tmp";
  }

  ~TempDir() {
    const std::string cmd = "rm -rf '" + _path + "'";
    if (_path != "/tmp") {
      const int rc = system(cmd.c_str());
      (void)rc;
    }
  }

  std::string file(const char* name) const { return _path + "/" + name; }

  std::string write(const char* name, const std::string& content) const {
    const std::string p = file(name);
    std::ofstream out(p.c_str(), std::ios::trunc);
    out << content;
    return p;
  }

  static std::string read(const std::string& path) {
    std::ifstream in(path.c_str());
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  }

  const std::string& path() const { return _path; }

private:
  std::string _path;
};
