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

#ifndef RUN_ARCHIVER_H
#define RUN_ARCHIVER_H

#include <cstdint>
#include <string>
#include <vector>

#include <aws/core/client/ClientConfiguration.h>
#include <aws/s3/S3Client.h>

namespace idlereaper {
namespace internal {

// Uploads a finished run directory to s3://<bucket>/<prefix><run>/<file>.
class RunArchiver {
public:
  RunArchiver(const Aws::Client::ClientConfiguration& client_config,
              const std::string& bucket, const std::string& prefix);

  // Return 0 means every file was uploaded, -1 means error.
  int8_t Archive(const std::string& run_dir);

  // Regular files directly inside dir_path, sorted.
  static int8_t ListRunFiles(const std::string& dir_path,
                             std::vector<std::string>* file_names);

private:
  Aws::S3::S3Client s3c_;
  std::string bucket_;
  std::string prefix_;
};

}  // namespace internal
}  // namespace idlereaper

#endif  // #ifndef RUN_ARCHIVER_H
