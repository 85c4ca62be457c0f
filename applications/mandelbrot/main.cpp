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
// Samples a 500x500 grid of the complex plane, packs the escape bit of every
// sample into bytes and prints the XOR of all the bytes.
//
// Build with OMP defined to compute the rows in parallel, and with TIMING
// defined to report the kernel time on the error stream.
//
// Usage: ./mandelbrot
//
//===----------------------------------------------------------------------===//

#include "mandelbrot.hpp"

#include <cstdint>
#include <exception>
#include <iostream>

#ifdef TIMING
#include <chrono>
#endif // TIMING

//===------------------------------------------------------------------------===
// Main
//===------------------------------------------------------------------------===

int main(int argc, char **argv) {
  if (argc > 1) {
    std::cerr << "Invalid number of arguments!\n";
    std::cerr << "Usage: " << argv[0] << "\n";
    return -1;
  }

  try {
#ifdef TIMING
    auto start = std::chrono::steady_clock::now();
#endif // TIMING

#ifdef OMP
    uint64_t sum = mandelbrot_checksum_parallel(SIZE);
#else
    uint64_t sum = mandelbrot_checksum(SIZE);
#endif // OMP

#ifdef TIMING
    std::chrono::duration<double> elapsed =
        std::chrono::steady_clock::now() - start;
    std::cerr << "Kernel time: " << elapsed.count() << "s\n";
#endif // TIMING

    std::cout << sum << "\n";
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }

  return 0;
}
