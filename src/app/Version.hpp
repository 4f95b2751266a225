#pragma once

#define LEXANON_VERSION_MAJOR 0
#define LEXANON_VERSION_MINOR 3
#define LEXANON_VERSION_PATCH 0
#define LEXANON_VERSION_STRING "0.3.0"
