#include "bags/router.hpp"
#include "bags/logger.hpp"
#include "bags/views.hpp"
#include <ftxui/component/event.hpp>
#include <ftxui/screen/terminal.hpp>
#include <algorithm>

namespace bags {

using namespace ftxui;

Router::Router(AppState& state, AppController& controller, InputStateMachine& machine,
               std::function<void()> on_quit)
  : state_(state)
  , controller_(controller)
  , machine_(machine)
  , on_quit_(std::move(on_quit)) {
}

void Router::updatePageHeight() {
  int rows = Terminal::Size().dimy - kChromeRows;
  if (state_.ui.tab == Tab::Portfolio) {
    rows -= 2;  // totals line
  }
  const size_t page = static_cast<size_t>(std::max(rows, 1));
  if (page != state_.ui.page_height) {
    state_.ui.page_height = page;
    state_.adjustScroll();
  }
}

Element Router::OnRender() {
  updatePageHeight();
  return RenderApp(state_);
}

bool Router::OnEvent(Event event) {
  if (event == Event::Custom) {
    try {
      controller_.onTick();
    } catch (const std::exception& e) {
      LOG_EXCEPTION(e, "idle tick");
      state_.setError(e.what());
    }
    return true;
  }

  bool handled = true;
  try {
    handled = machine_.handle(event);
  } catch (const std::exception& e) {
    LOG_EXCEPTION(e, "input handling");
    state_.setError(e.what());
  }
  if (state_.ui.quit && on_quit_) {
    on_quit_();
  }
  return handled;
}

// Factory function
Component MakeRouter(AppState& state, AppController& controller, InputStateMachine& machine,
                     std::function<void()> on_quit) {
  return std::make_shared<Router>(state, controller, machine, std::move(on_quit));
}

} // namespace bags
