#pragma once

/**
 *  @defgroup file_io file_io
 *  @brief Parsers turning toolkit output into records.
 */

#include <biodispatch/file_io/pileup.hpp>
