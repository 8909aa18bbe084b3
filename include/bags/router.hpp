#pragma once
#include <functional>
#include <ftxui/component/component.hpp>
#include "controller.hpp"
#include "input_machine.hpp"
#include "state.hpp"

namespace bags {

// Root component: draws AppState and routes events to the input machine.
// Event::Custom is the idle tick posted by the main loop.
class Router : public ftxui::ComponentBase {
public:
  Router(AppState& state, AppController& controller, InputStateMachine& machine,
         std::function<void()> on_quit);

  // ComponentBase overrides
  ftxui::Element OnRender() override;
  bool OnEvent(ftxui::Event event) override;

private:
  AppState& state_;
  AppController& controller_;
  InputStateMachine& machine_;
  std::function<void()> on_quit_;

  // Fits the table to the terminal height
  void updatePageHeight();
};

// Factory function for creating the router component
ftxui::Component MakeRouter(AppState& state, AppController& controller, InputStateMachine& machine,
                            std::function<void()> on_quit);

} // namespace bags
