/*
 * Copyright 2018-2021 Board of Trustees of Stanford University
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

#include <dirent.h>
#include <sys/stat.h>
#include <algorithm>
#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include <aws/core/Aws.h>
#include <aws/s3/model/PutObjectRequest.h>

#include "run_archiver.h"

namespace idlereaper {
namespace internal {

RunArchiver::RunArchiver(const Aws::Client::ClientConfiguration& client_config,
                         const std::string& bucket, const std::string& prefix)
    : s3c_(client_config), bucket_(bucket), prefix_(prefix) {}

int8_t RunArchiver::ListRunFiles(const std::string& dir_path,
                                 std::vector<std::string>* file_names) {
  DIR* dir;
  struct dirent* ent;
  if ((dir = opendir(dir_path.c_str())) == NULL) {
    std::cerr << "[RunArchiver] Failed to open directory: " << dir_path
              << std::endl;
    return -1;
  }
  while ((ent = readdir(dir)) != NULL) {
    std::string fname(ent->d_name);
    struct stat buffer;
    if (stat((dir_path + "/" + fname).c_str(), &buffer) != 0) { continue; }
    if (S_ISREG(buffer.st_mode)) { file_names->push_back(fname); }
  }
  closedir(dir);
  std::sort(file_names->begin(), file_names->end());
  return 0;
}

int8_t RunArchiver::Archive(const std::string& run_dir) {
  std::string base = run_dir;
  while (base.size() > 1 && base.back() == '/') { base.pop_back(); }
  std::string run_name = base.substr(base.rfind('/') + 1);

  std::vector<std::string> file_names;
  if (ListRunFiles(base, &file_names)) { return -1; }

  for (auto& file_name : file_names) {
    std::string key_name = prefix_ + run_name + "/" + file_name;
    std::string local_path = base + "/" + file_name;
    Aws::S3::Model::PutObjectRequest object_request;
    object_request.WithBucket(Aws::String(bucket_.c_str()))
        .WithKey(Aws::String(key_name.c_str()));
    auto input_data = Aws::MakeShared<Aws::FStream>(
        "PutObjectInputStream", local_path.c_str(),
        std::ios_base::in | std::ios_base::binary);
    if (!input_data->good()) {
      std::cerr << "[RunArchiver] Cannot read " << local_path << std::endl;
      return -1;
    }
    object_request.SetBody(input_data);
    std::cout << "[LOG]: Uploading " << local_path << " to s3://" << bucket_
              << "/" << key_name << std::endl;
    auto put_object_outcome = s3c_.PutObject(object_request);
    if (!put_object_outcome.IsSuccess()) {
      std::cerr << "PutObject error: "
                << put_object_outcome.GetError().GetExceptionName() << " "
                << put_object_outcome.GetError().GetMessage() << std::endl;
      return -1;
    }
  }
  return 0;
}

}  // namespace internal
}  // namespace idlereaper
