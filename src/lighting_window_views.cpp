#include "lighting_window.hpp"

#include "features/navigation_feature.hpp"
#include "ui/led_visualizer.hpp"
#include "ui/scope_controls_panel.hpp"

void LightingWindow::update_scope_views() {
    const auto& scope = m_DevicesController.selected_scope();
    const Device* device = m_DevicesController.selected_device();
    if (!scope || !device) {
        m_ControlsPanel->clear();
        m_Visualizer->set_device(nullptr, std::nullopt);
        m_StreamBinding.unbind();
        return;
    }

    features::reveal_scope(m_selecting_programmatically, *scope, m_NodeIters, m_TreeView, m_ScopeTreeStore);
    m_ControlsPanel->show_scope(*device, *scope, m_DevicesController.effects());
    m_Visualizer->set_device(device, scope);
    m_StreamBinding.bind(device->port);
}

// Widgets must not be rebuilt from inside their own change handlers.
void LightingWindow::schedule_views_update() {
    if (m_ViewsIdle.connected()) {
        return;
    }
    m_ViewsIdle = Glib::signal_idle().connect([this]() {
        update_scope_views();
        return false;
    });
}
