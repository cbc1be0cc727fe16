#include "word_source.hpp"

const std::vector<std::string>& RandomWordSource::default_words() {
  static const std::vector<std::string> words = {
    "Teddybaer", "Bauklotz", "Murmel", "Kuscheltier", "Puppe", "Ball", "Kreisel",
    "Holzauto", "Bilderbuch", "Wachsmalstift", "Knete", "Seifenblasen", "Drache",
    "Ritterburg", "Puzzle", "Memory", "Stofftier", "Bagger", "Eisenbahn", "Rassel",
    "Xylophon", "Trommel", "Schaukelpferd", "Kaufladen", "Zauberstab", "Piratenschiff",
    "Dinosaurier", "Roboter", "Taschenlampe", "Sticker", "Haarspange", "Socke",
    "Kissen", "Nachtlicht", "Spieluhr", "Wuerfel", "Kartenspiel", "Flummi", "Lego",
    "Malbuch", "Buntstift", "Schatzkiste", "Einhorn", "Feuerwehrauto", "Kran",
    "Hubschrauber", "Rennauto", "Mundharmonika", "Pinsel", "Schere",
  };
  return words;
}

RandomWordSource::RandomWordSource(uint32_t seed)
  : RandomWordSource(default_words(), seed) {}

RandomWordSource::RandomWordSource(std::vector<std::string> words, uint32_t seed)
  : words_(std::move(words)), rng_(seed) {}

std::optional<std::string> RandomWordSource::select(size_t max_len) {
  std::vector<const std::string*> fits;
  fits.reserve(words_.size());
  for (const auto& w : words_) if (w.size() <= max_len) fits.push_back(&w);
  if (fits.empty()) return std::nullopt;
  std::uniform_int_distribution<size_t> dist(0, fits.size() - 1);
  return *fits[dist(rng_)];
}
