#include "sparx64.h"

#include <utility>

#include "../randflake-error/randflake_error.h"

using namespace std;

namespace {

inline uint16_t rotl(uint16_t x, unsigned n) {
  return static_cast<uint16_t>((x << n) | (x >> (16 - n)));
}

// One keyless round of SPECK-32
inline void arx_round(uint16_t& l, uint16_t& r) {
  l = rotl(l, 9);
  l = static_cast<uint16_t>(l + r);
  r = rotl(r, 2);
  r ^= l;
}

inline void arx_round_inv(uint16_t& l, uint16_t& r) {
  r ^= l;
  r = rotl(r, 14);
  l = static_cast<uint16_t>(l - r);
  l = rotl(l, 7);
}

// Linear layer for two branches
inline void linear_layer(uint16_t x[2 * SPARX_N_BRANCHES]) {
  uint16_t tmp = rotl(x[0] ^ x[1], 8);
  x[2] ^= x[0] ^ tmp;
  x[3] ^= x[1] ^ tmp;
  swap(x[0], x[2]);
  swap(x[1], x[3]);
}

inline void linear_layer_inv(uint16_t x[2 * SPARX_N_BRANCHES]) {
  swap(x[0], x[2]);
  swap(x[1], x[3]);
  uint16_t tmp = rotl(x[0] ^ x[1], 8);
  x[2] ^= x[0] ^ tmp;
  x[3] ^= x[1] ^ tmp;
}

// Key state permutation between two subkey extractions
inline void key_permutation(uint16_t k[SPARX_KEY_WORDS], uint16_t c) {
  arx_round(k[0], k[1]);
  k[2] = static_cast<uint16_t>(k[2] + k[0]);
  k[3] = static_cast<uint16_t>(k[3] + k[1]);
  k[7] = static_cast<uint16_t>(k[7] + c);

  // Rotate the key state right by two words
  uint16_t tmp0 = k[6];
  uint16_t tmp1 = k[7];
  for (int i = SPARX_KEY_WORDS - 1; i >= 2; --i) {
    k[i] = k[i - 2];
  }
  k[0] = tmp0;
  k[1] = tmp1;
}

inline void load_block(uint16_t x[4], const uint8_t* src) {
  for (int i = 0; i < 4; ++i) {
    x[i] = static_cast<uint16_t>((src[2 * i] << 8) | src[2 * i + 1]);
  }
}

inline void store_block(uint8_t* dst, const uint16_t x[4]) {
  for (int i = 0; i < 4; ++i) {
    dst[2 * i] = static_cast<uint8_t>(x[i] >> 8);
    dst[2 * i + 1] = static_cast<uint8_t>(x[i]);
  }
}

}  // namespace

Sparx64::Sparx64(const vector<uint8_t>& key) {
  if (key.size() != SPARX64_KEY_SIZE) {
    throw RandflakeError(RandflakeErrc::kInvalidSecret);
  }

  uint16_t master_key[SPARX_KEY_WORDS];
  for (int i = 0; i < SPARX_KEY_WORDS; ++i) {
    master_key[i] = static_cast<uint16_t>((key[2 * i] << 8) | key[2 * i + 1]);
  }

  key_schedule(master_key);

  // The working copy of the key is no longer needed
  volatile uint16_t* wipe = master_key;
  for (int i = 0; i < SPARX_KEY_WORDS; ++i) {
    wipe[i] = 0;
  }
}

Sparx64::~Sparx64() { destroy(); }

/**
 * Emits the first six words of the key state as subkey set c-1, then
 * permutes the state with round constant c, for c = 1..17. The last set is
 * only used for output whitening.
 */
void Sparx64::key_schedule(uint16_t master_key[SPARX_KEY_WORDS]) {
  for (int c = 0; c < SPARX_N_SUBKEYS; ++c) {
    for (int i = 0; i < 2 * SPARX_ROUNDS_PER_STEP; ++i) {
      subkeys[c][i] = master_key[i];
    }
    key_permutation(master_key, static_cast<uint16_t>(c + 1));
  }
}

void Sparx64::encrypt(uint8_t* dst, const uint8_t* src) const {
  uint16_t x[2 * SPARX_N_BRANCHES];
  load_block(x, src);

  for (int s = 0; s < SPARX_N_STEPS; ++s) {
    for (int b = 0; b < SPARX_N_BRANCHES; ++b) {
      const uint16_t* k = subkeys[SPARX_N_BRANCHES * s + b];
      for (int r = 0; r < SPARX_ROUNDS_PER_STEP; ++r) {
        x[2 * b] ^= k[2 * r];
        x[2 * b + 1] ^= k[2 * r + 1];
        arx_round(x[2 * b], x[2 * b + 1]);
      }
    }
    linear_layer(x);
  }

  // Output whitening
  const uint16_t* w = subkeys[SPARX_N_BRANCHES * SPARX_N_STEPS];
  for (int b = 0; b < SPARX_N_BRANCHES; ++b) {
    x[2 * b] ^= w[2 * b];
    x[2 * b + 1] ^= w[2 * b + 1];
  }

  store_block(dst, x);
}

void Sparx64::decrypt(uint8_t* dst, const uint8_t* src) const {
  uint16_t x[2 * SPARX_N_BRANCHES];
  load_block(x, src);

  const uint16_t* w = subkeys[SPARX_N_BRANCHES * SPARX_N_STEPS];
  for (int b = 0; b < SPARX_N_BRANCHES; ++b) {
    x[2 * b] ^= w[2 * b];
    x[2 * b + 1] ^= w[2 * b + 1];
  }

  for (int s = SPARX_N_STEPS - 1; s >= 0; --s) {
    linear_layer_inv(x);
    for (int b = 0; b < SPARX_N_BRANCHES; ++b) {
      const uint16_t* k = subkeys[SPARX_N_BRANCHES * s + b];
      for (int r = SPARX_ROUNDS_PER_STEP - 1; r >= 0; --r) {
        arx_round_inv(x[2 * b], x[2 * b + 1]);
        x[2 * b] ^= k[2 * r];
        x[2 * b + 1] ^= k[2 * r + 1];
      }
    }
  }

  store_block(dst, x);
}

void Sparx64::destroy() {
  volatile uint16_t* wipe = &subkeys[0][0];
  for (int i = 0; i < SPARX_N_SUBKEYS * 2 * SPARX_ROUNDS_PER_STEP; ++i) {
    wipe[i] = 0;
  }
}
