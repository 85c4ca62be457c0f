//===-------------------------------------------------------------------------===
// Copyright © 2004-2008 Brent Fulgham, 2005-2024 Isaac Gouy All rights
// reserved.
//
// Modified in 2025 by Victor Briganti
//
// Redistribution and use in source and binary forms, with or without
// modification, are permitted provided that the following conditions are met:
//
// 1. Redistributions of source code must retain the above copyright notice,
// this list of conditions and the following disclaimer.
//
// 2. Redistributions in binary form must reproduce the above copyright notice,
// this list of conditions and the following disclaimer in the documentation
// and/or other materials provided with the distribution.
//
// 3. Neither the name "The Computer Language Benchmarks Game" nor the name "The
// Benchmarks Game" nor the name "The Computer Language Shootout Benchmarks" nor
// the names of its contributors may be used to endorse or promote products
// derived from this software without specific prior written permission.
//
// THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS"
// AND ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE
// IMPLIED WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE
// ARE DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT OWNER OR CONTRIBUTORS BE
// LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR
// CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF
// SUBSTITUTE GOODS OR SERVICES; LOSS OF USE, DATA, OR PROFITS; OR BUSINESS
// INTERRUPTION) HOWEVER CAUSED AND ON ANY THEORY OF LIABILITY, WHETHER IN
// CONTRACT, STRICT LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE)
// ARISING IN ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
// POSSIBILITY OF SUCH DAMAGE.
//===----------------------------------------------------------------------===//
// Mandelbrot
//
// Computes the escape bits of a square grid over the region
// [-1.5, 0.5] x [-1.0, 1.0] and reduces them into a checksum byte.
//
//===----------------------------------------------------------------------===//

#include "mandelbrot.hpp"

#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

//===------------------------------------------------------------------------===
// Helper Functions
//===------------------------------------------------------------------------===

static void check_size(int size) {
  if (size <= 0) {
    throw std::invalid_argument("grid size must be positive, got " +
                                std::to_string(size));
  }
}

//===------------------------------------------------------------------------===
// Checksum Fold
//===------------------------------------------------------------------------===

void ChecksumFolder::fold_row(const std::vector<uint8_t> &bits) {
  for (size_t x = 0; x < bits.size(); x++) {
    push(bits[x], x + 1 == bits.size());
  }
}

//===------------------------------------------------------------------------===
// Mandelbrot Set
//===------------------------------------------------------------------------===

static void fill_row(int y, int size, std::vector<uint8_t> &bits) {
  bits.assign(size, 0);
  double ci = imag_coordinate(y, size);

  for (int x = 0; x < size; x++) {
    bits[x] = escapes(real_coordinate(x, size), ci) ? 1 : 0;
  }
}

std::vector<uint8_t> escape_row(int y, int size) {
  check_size(size);

  std::vector<uint8_t> bits;
  fill_row(y, size, bits);
  return bits;
}

uint64_t mandelbrot_checksum(int size) {
  check_size(size);

  ChecksumFolder folder;

  for (int y = 0; y < size; y++) {
    double ci = imag_coordinate(y, size);

    for (int x = 0; x < size; x++) {
      double cr = real_coordinate(x, size);
      folder.push(escapes(cr, ci) ? 1 : 0, x == size - 1);
    }
  }

  return folder.sum();
}

uint64_t mandelbrot_checksum_parallel(int size) {
  check_size(size);

  std::vector<std::vector<uint8_t>> rows(size);

#pragma omp parallel for shared(rows) schedule(dynamic) num_threads(NUM_THREADS)
  for (int y = 0; y < size; y++) {
    fill_row(y, size, rows[y]);
  }

  ChecksumFolder folder;
  for (const std::vector<uint8_t> &row : rows) {
    folder.fold_row(row);
  }

  return folder.sum();
}
