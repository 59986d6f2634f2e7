#ifndef __LIVEMIG_LIVEMIG_HPP__
#define __LIVEMIG_LIVEMIG_HPP__

#include <livemig/collaborators.hpp>
#include <livemig/compatibility.hpp>
#include <livemig/dispatcher.hpp>
#include <livemig/errors.hpp>
#include <livemig/host.hpp>
#include <livemig/instance.hpp>
#include <livemig/live_migration.hpp>
#include <livemig/options.hpp>
#include <livemig/selector.hpp>
#include <livemig/validator.hpp>

#endif
