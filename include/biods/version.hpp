// Copyright The biods Developers.

#ifndef BIODS_VERSION_HPP_
#define BIODS_VERSION_HPP_
#define BIODS_VERSION "0.1.0"
#endif
