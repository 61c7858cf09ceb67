#pragma once

#include <boost/log/trivial.hpp>

// The core never logs. These are for code built on top of it.
#define FORGE_LOG_TRACE   BOOST_LOG_TRIVIAL(trace)
#define FORGE_LOG_DEBUG   BOOST_LOG_TRIVIAL(debug)
#define FORGE_LOG_INFO    BOOST_LOG_TRIVIAL(info)
#define FORGE_LOG_WARNING BOOST_LOG_TRIVIAL(warning)
#define FORGE_LOG_ERROR   BOOST_LOG_TRIVIAL(error)
