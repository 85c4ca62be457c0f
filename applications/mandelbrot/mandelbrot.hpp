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
// Escape-time kernel and checksum fold of the mandelbrot benchmark.
//
// Every sample of a square grid is run through the escape-time map, the
// resulting bits are packed MSB-first into bytes and the bytes are folded into
// a single checksum with XOR.
//
//===----------------------------------------------------------------------===//

#ifndef MANDELBROT_HPP
#define MANDELBROT_HPP

#include <cstdint>
#include <stdexcept>
#include <vector>

#ifndef NUM_THREADS
#define NUM_THREADS 4
#endif // NUM_THREADS

// Side of the square grid sampled by the benchmark.
constexpr int SIZE = 500;

// This is the limit that pixels will need to exceed in order to escape from the
// Mandelbrot set.
constexpr double LIMIT = 4.0;

// Controls the maximum amount of iterations that are done for each pixel.
constexpr int MAX_ITERATIONS = 50;

//===------------------------------------------------------------------------===
// Coordinates
//===------------------------------------------------------------------------===

inline double real_coordinate(int x, int size) {
  return (2.0 * x / size) - 1.5;
}

inline double imag_coordinate(int y, int size) {
  return (2.0 * y / size) - 1.0;
}

//===------------------------------------------------------------------------===
// Escape Test
//===------------------------------------------------------------------------===

// Returns the iteration (starting at 1) on which the point left the radius, or
// 0 if it is still bounded after MAX_ITERATIONS.
//
// The imaginary part is updated with the real part of the current iteration,
// and the squares used for the next real part are the ones of the previous
// iteration. Changing this order changes the checksum.
inline int escape_iteration(double cr, double ci) {
  double zr = 0.0;
  double zi = 0.0;
  double zrzr = 0.0;
  double zizi = 0.0;

  for (int i = 0; i < MAX_ITERATIONS; i++) {
    zr = zrzr - zizi + cr;
    zi = 2.0 * zr * zi + ci;

    zrzr = zr * zr;
    zizi = zi * zi;

    if (zrzr + zizi > LIMIT) {
      return i + 1;
    }
  }

  return 0;
}

inline bool escapes(double cr, double ci) {
  return escape_iteration(cr, ci) != 0;
}

//===------------------------------------------------------------------------===
// Checksum Fold
//===------------------------------------------------------------------------===

class ChecksumFolder {
public:
  // Packs one escape bit. A full byte is folded right away; on the last
  // column of a row the partial byte is padded with zeros and folded.
  inline void push(uint64_t bit, bool lastInRow) {
    if (bit > 1) {
      throw std::invalid_argument("escape bit must be 0 or 1");
    }

    byteAcc = (byteAcc << 1) + bit;
    bitNum++;

    if (bitNum == 8) {
      flush();
    } else if (lastInRow) {
      byteAcc <<= 8 - bitNum;
      flush();
    }
  }

  void fold_row(const std::vector<uint8_t> &bits);

  uint64_t sum() const { return checksum; }
  uint64_t pending_byte() const { return byteAcc; }
  int pending_bits() const { return bitNum; }

private:
  inline void flush() {
    checksum ^= byteAcc;
    byteAcc = 0;
    bitNum = 0;
  }

  uint64_t checksum = 0;
  uint64_t byteAcc = 0;
  int bitNum = 0;
};

//===------------------------------------------------------------------------===
// Grid
//===------------------------------------------------------------------------===

std::vector<uint8_t> escape_row(int y, int size);

uint64_t mandelbrot_checksum(int size = SIZE);

// Rows are computed in parallel, the fold runs afterwards in row order since
// the packed bytes depend on the sequence of bits.
uint64_t mandelbrot_checksum_parallel(int size = SIZE);

#endif // MANDELBROT_HPP
