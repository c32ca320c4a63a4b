#pragma once
#include <string>

#include "core/remote/ArchiveRemote.hpp"

namespace alib {

// Vault client speaking the Glacier-style REST dialect:
//   POST   /{vault}/archives
//   POST   /{vault}/multipart-uploads
//   PUT    /{vault}/multipart-uploads/{handle}   (Content-Range)
//   POST   /{vault}/multipart-uploads/{handle}   (complete)
//   DELETE /{vault}/multipart-uploads/{handle}
//   GET    /{vault}/multipart-uploads/{handle}
//   POST   /{vault}/jobs,  GET /{vault}/jobs/{id}
//
// A fresh connection is opened per call so parts can go out from several
// threads at once.
class HttpArchiveRemote : public ArchiveRemote {
public:
  HttpArchiveRemote(std::string baseUrl, std::string vault, std::string apiKey = {},
                    int timeoutSeconds = 60);

  CompletedUpload uploadArchive(const std::string& description,
                                std::string_view bytes,
                                const std::string& treeHash) override;
  std::string initiateUpload(const std::string& description, uint64_t partSize) override;
  std::string uploadPart(const std::string& handle, uint64_t offset,
                         std::string_view bytes, const std::string& checksum) override;
  CompletedUpload completeUpload(const std::string& handle, uint64_t totalSize,
                                 const std::string& treeHash) override;
  void abortUpload(const std::string& handle) override;
  RemoteJobStatus describeUpload(const std::string& handle) override;
  std::string initiateRetrieval(const std::string& remoteArchiveId,
                                const ByteRange& range,
                                const std::string& description) override;
  RemoteJobStatus describeJob(const std::string& remoteJobId) override;

private:
  std::string path(const std::string& suffix) const;

  std::string baseUrl_;
  std::string vault_;
  std::string apiKey_;
  int timeoutSeconds_;
};

} // namespace alib
