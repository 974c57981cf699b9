#pragma once
#include <string>

#include "livewire/Advertisement.hpp"

/**
 * Fixed-width text table, one row per channel. An advertisement without
 * channels gets a single row with the channel columns left as "-".
 */
class AdvertisementTable
{
public:
  static std::string header();
  static std::string formatRows(const livewire::Advertisement &advertisement,
                                const std::string &timestamp);
};
