#include "batch/batch_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/errors.hpp"
#include "utilities/logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <set>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace merkseal {

const std::string BatchStore::METADATA_FILE = "metadata.json";

namespace {

const std::string TEMP_SUFFIX = ".tmp";

bool isReservedName(const std::string &name) {
  return name == BatchStore::METADATA_FILE ||
         name == BatchStore::METADATA_FILE + TEMP_SUFFIX;
}

std::string osReason() { return std::strerror(errno); }

void writeBlob(const fs::path &path, const std::vector<std::byte> &data) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out.is_open())
    throw StorageError(path.string(), osReason());
  if (!data.empty())
    out.write(reinterpret_cast<const char *>(data.data()),
              static_cast<std::streamsize>(data.size()));
  out.close();
  if (out.fail())
    throw StorageError(path.string(), "write failed");
}

std::vector<std::byte> readBlob(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw StorageError(path.string(), osReason());
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  if (in.bad())
    throw StorageError(path.string(), "read failed");
  std::vector<std::byte> data(tmp.size());
  if (!tmp.empty())
    std::memcpy(data.data(), tmp.data(), tmp.size());
  return data;
}

} // namespace

BatchStore::BatchStore(std::string rootDir, HashScheme scheme,
                       BatchIdAllocator &ids)
    : rootDir_(std::move(rootDir)), scheme_(scheme), ids_(ids) {}

std::string BatchStore::batchDir(uint64_t batchId) const {
  return (fs::path(rootDir_) / std::to_string(batchId)).string();
}

bool BatchStore::exists(uint64_t batchId) const {
  std::error_code ec;
  return fs::is_regular_file(fs::path(batchDir(batchId)) / METADATA_FILE, ec);
}

void BatchStore::validateFileName(const std::string &name) {
  if (name.empty() || name == "." || name == "..")
    throw std::invalid_argument("Invalid file name '" + name + "'");
  if (name.find_first_of(std::string("/\\\0", 3)) != std::string::npos)
    throw std::invalid_argument("File name '" + name +
                                "' must not contain path separators");
  if (isReservedName(name))
    throw std::invalid_argument("File name '" + name + "' is reserved");
}

BatchRecord BatchStore::create(const std::vector<BatchFile> &files,
                               const std::string &registryAddress) {
  if (files.empty())
    throw EmptyInputError("No files supplied for batch");
  return create(ids_.next(), files, registryAddress);
}

BatchRecord BatchStore::create(uint64_t batchId,
                               const std::vector<BatchFile> &files,
                               const std::string &registryAddress) {
  if (files.empty())
    throw EmptyInputError("No files supplied for batch");

  std::set<std::string> seen;
  for (const auto &f : files) {
    validateFileName(f.name);
    if (!seen.insert(f.name).second)
      throw std::invalid_argument("Duplicate file name '" + f.name + "'");
  }

  // Leaf order is lexicographic by name, the same order loadFiles uses.
  std::vector<const BatchFile *> ordered;
  ordered.reserve(files.size());
  for (const auto &f : files)
    ordered.push_back(&f);
  std::sort(ordered.begin(), ordered.end(),
            [](const BatchFile *a, const BatchFile *b) {
              return a->name < b->name;
            });

  const fs::path dir = batchDir(batchId);
  std::error_code ec;
  fs::create_directories(rootDir_, ec);
  if (ec)
    throw StorageError(rootDir_, ec.message());
  if (!fs::create_directory(dir, ec)) {
    throw StorageError(dir.string(),
                       ec ? ec.message() : "batch directory already exists");
  }

  std::vector<Digest> leaves;
  leaves.reserve(ordered.size());
  for (const BatchFile *f : ordered) {
    leaves.push_back(hashData(f->data));
    writeBlob(dir / f->name, f->data);
  }

  BatchRecord record;
  record.localBatchId = batchId;
  record.root = digestToHex(MerkleTree::computeRoot(leaves, scheme_));
  record.fileCount = files.size();
  record.suggestedMetaUri = suggestedMetaUriFor(batchId);
  record.registryAddress = registryAddress;
  writeRecord(record);

  Logger::getInstance().log(LogLevel::INFO,
                            "Batch " + std::to_string(batchId) + " created: " +
                                std::to_string(record.fileCount) +
                                " files, root " + record.root);
  return record;
}

void BatchStore::writeRecord(const BatchRecord &record) const {
  const fs::path dir = batchDir(record.localBatchId);
  const fs::path finalPath = dir / METADATA_FILE;
  const fs::path tmpPath = dir / (METADATA_FILE + TEMP_SUFFIX);

  const std::string text = batchRecordToJson(record).dump(2) + "\n";
  std::vector<std::byte> bytes(text.size());
  std::memcpy(bytes.data(), text.data(), text.size());
  writeBlob(tmpPath, bytes);

  std::error_code ec;
  fs::rename(tmpPath, finalPath, ec);
  if (ec)
    throw StorageError(finalPath.string(), ec.message());
}

BatchRecord BatchStore::load(uint64_t batchId) const {
  const fs::path path = fs::path(batchDir(batchId)) / METADATA_FILE;
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    if (ec)
      throw StorageError(path.string(), ec.message());
    throw NotFoundError(batchId);
  }

  std::ifstream in(path, std::ios::binary);
  if (!in.is_open())
    throw StorageError(path.string(), osReason());
  std::ostringstream ss;
  ss << in.rdbuf();
  if (in.bad())
    throw StorageError(path.string(), "read failed");
  return batchRecordFromJson(ss.str(), batchId);
}

std::vector<BatchFile> BatchStore::loadFiles(uint64_t batchId) const {
  const fs::path dir = batchDir(batchId);
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec)
    throw StorageError(dir.string(), ec.message());

  std::vector<std::string> names;
  try {
    for (const auto &entry : it) {
      if (!entry.is_regular_file(ec))
        continue;
      std::string name = entry.path().filename().string();
      if (isReservedName(name))
        continue;
      names.push_back(name);
    }
  } catch (const fs::filesystem_error &e) {
    throw StorageError(dir.string(), e.code().message());
  }
  std::sort(names.begin(), names.end());

  std::vector<BatchFile> files;
  files.reserve(names.size());
  for (const auto &name : names) {
    files.push_back(BatchFile{name, readBlob(dir / name)});
  }
  return files;
}

Digest BatchStore::recomputeRoot(uint64_t batchId) const {
  auto files = loadFiles(batchId);
  if (files.empty())
    throw EmptyInputError("Batch " + std::to_string(batchId) +
                          " holds no files");
  std::vector<Digest> leaves;
  leaves.reserve(files.size());
  for (const auto &f : files)
    leaves.push_back(hashData(f.data));
  return MerkleTree::computeRoot(leaves, scheme_);
}

BatchRecord BatchStore::recordAnchor(uint64_t batchId,
                                     uint64_t mantleBatchId) {
  std::lock_guard<std::mutex> lock(anchorMutex_);
  BatchRecord record = load(batchId);
  if (record.mantleBatchId) {
    if (*record.mantleBatchId == mantleBatchId)
      return record;
    throw std::logic_error("Batch " + std::to_string(batchId) +
                           " is already anchored as " +
                           std::to_string(*record.mantleBatchId));
  }
  record.mantleBatchId = mantleBatchId;
  writeRecord(record);
  Logger::getInstance().log(LogLevel::INFO,
                            "Batch " + std::to_string(batchId) +
                                " anchored as Mantle batch " +
                                std::to_string(mantleBatchId));
  return record;
}

uint64_t BatchStore::highestBatchId() const {
  std::error_code ec;
  if (!fs::is_directory(rootDir_, ec))
    return 0;
  fs::directory_iterator it(rootDir_, ec);
  if (ec)
    throw StorageError(rootDir_, ec.message());

  uint64_t highest = 0;
  for (const auto &entry : it) {
    std::error_code entryEc;
    if (!entry.is_directory(entryEc))
      continue;
    const std::string name = entry.path().filename().string();
    if (name.empty() ||
        !std::all_of(name.begin(), name.end(),
                     [](unsigned char c) { return c >= '0' && c <= '9'; }))
      continue;
    try {
      highest = std::max<uint64_t>(highest, std::stoull(name));
    } catch (const std::out_of_range &) {
      Logger::getInstance().log(LogLevel::WARN,
                                "Ignoring out of range batch directory " +
                                    name);
    }
  }
  return highest;
}

} // namespace merkseal
