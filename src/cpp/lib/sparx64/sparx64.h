#ifndef SPARX64_H
#define SPARX64_H

#include <cstddef>
#include <cstdint>
#include <vector>

// SPARX-64/128 parameters
const int SPARX_N_STEPS = 8;
const int SPARX_ROUNDS_PER_STEP = 3;
const int SPARX_N_BRANCHES = 2;
const int SPARX_KEY_WORDS = 8;
const int SPARX_N_SUBKEYS = SPARX_N_BRANCHES * SPARX_N_STEPS + 1;

const size_t SPARX64_BLOCK_SIZE = 8;
const size_t SPARX64_KEY_SIZE = 16;

/**
 * SPARX-64/128 block cipher: a keyed bijection over 8-byte blocks.
 *
 * Used to turn the sequential raw value of an ID into an opaque one. The
 * subkey schedule is computed once in the constructor and only read
 * afterwards, so encrypt() and decrypt() are safe to call concurrently.
 * The schedule is zeroed by destroy() and by the destructor.
 */
class Sparx64 {
 private:
  uint16_t subkeys[SPARX_N_SUBKEYS][2 * SPARX_ROUNDS_PER_STEP];

  void key_schedule(uint16_t master_key[SPARX_KEY_WORDS]);

 public:
  // Throws RandflakeError(kInvalidSecret) unless key is exactly 16 bytes.
  explicit Sparx64(const std::vector<uint8_t>& key);
  ~Sparx64();

  Sparx64(const Sparx64&) = delete;
  Sparx64& operator=(const Sparx64&) = delete;

  // dst and src are 8-byte blocks and may alias.
  void encrypt(uint8_t* dst, const uint8_t* src) const;
  void decrypt(uint8_t* dst, const uint8_t* src) const;

  size_t block_size() const { return SPARX64_BLOCK_SIZE; }

  // Overwrites every subkey word with zero.
  void destroy();
};

#endif  // SPARX64_H
