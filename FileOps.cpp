#include "FileOps.hpp"
#include "Errors.hpp"

#include <format>
#include <fstream>
#include <ios>
#include <ostream>
#include <string>
#include <system_error>
#include <cstring>
#include <cerrno>

namespace crj_fix {

namespace {

std::string Cause(std::string_view action) {
  auto msg = std::string{action};
  if (errno != 0) {
    msg += " (";
    msg += std::strerror(errno);
    msg += ")";
  }
  return msg;
} // Cause

std::string Cause(std::string_view action, const std::error_code& ec) {
  return std::format("{} ({})", action, ec.message());
} // Cause

void Write(const fs::path& path, std::string_view text,
           std::ios::openmode mode)
{
  errno = 0;
  auto ofs = std::ofstream{path, mode | std::ios::binary};
  if (!ofs)
    throw IoFailure{path, Cause("cannot open file for writing")};
  ofs.write(text.data(), static_cast<std::streamsize>(text.size()));
  ofs.flush();
  if (!ofs)
    throw IoFailure{path, Cause("failed to write file")};
} // Write

} // local

std::string ReadTextFile(const fs::path& path) {
  errno = 0;
  auto ifs = std::ifstream{path, std::ios::binary};
  if (!ifs)
    throw IoFailure{path, Cause("cannot open file")};
  ifs.seekg(0, std::ios::end);
  auto size = ifs.tellg();
  if (size < 0)
    throw IoFailure{path, Cause("failed to stat file")};
  ifs.seekg(0, std::ios::beg);
  auto buf = std::string(static_cast<std::size_t>(size), '\0');
  if (!ifs.read(buf.data(), static_cast<std::streamsize>(buf.size())))
    throw IoFailure{path, Cause("failed to read file")};
  return buf;
} // ReadTextFile

void WriteTextFile(const fs::path& path, std::string_view text)
  { Write(path, text, std::ios::out | std::ios::trunc); }

void AppendTextFile(const fs::path& path, std::string_view text)
  { Write(path, text, std::ios::out | std::ios::app); }

void CreateDirectory(const fs::path& path, std::ostream& log) {
  log << std::format("Creating directory: '{}'\n", path.string());
  auto ec = std::error_code{};
  fs::create_directories(path, ec);
  if (ec)
    throw IoFailure{path, Cause("cannot create directory", ec)};
} // CreateDirectory

void CopyFile(const fs::path& from, const fs::path& to, std::ostream& log) {
  log << std::format("Copying file: From '{}' to '{}'\n",
                     from.string(), to.string());
  auto ec = std::error_code{};
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec)
    throw IoFailure{from, Cause("cannot copy to '" + to.string() + "'", ec)};
} // CopyFile

void RemoveDirectory(const fs::path& path, std::ostream& log) {
  log << std::format("Removing directory: '{}'\n", path.string());
  auto ec = std::error_code{};
  fs::remove_all(path, ec);
  if (ec)
    throw IoFailure{path, Cause("cannot remove directory", ec)};
} // RemoveDirectory

void WriteFile(const fs::path& path, std::string_view text,
               std::ostream& log)
{
  log << std::format("Writing file: '{}'\n", path.string());
  WriteTextFile(path, text);
} // WriteFile

} // crj_fix
