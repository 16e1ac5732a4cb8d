/**
 * @file views.hpp
 * @brief Pure rendering of AppState
 *
 * Nothing here changes state; every function maps the current state onto
 * an FTXUI element tree.
 */

#ifndef VIEWS_HPP
#define VIEWS_HPP

#include <string>
#include <vector>

#include <ftxui/dom/elements.hpp>

#include "appstate.hpp"

/** @brief Latency trend as block characters, one per sample */
std::string sparkline(const std::vector<double> &samples);

ftxui::Element renderDashboard(const AppState &state, const World &world);
ftxui::Element renderMain(const AppState &state, const World &world);
ftxui::Element renderConnections(const AppState &state, const World &world);

/** @brief Menu bar, current screen, status bar and the active overlay */
ftxui::Element renderApp(const AppState &state, const World &world);

#endif // VIEWS_HPP
