#include "lighting_window.hpp"

#include "features/navigation_feature.hpp"
#include "ui/led_visualizer.hpp"

void LightingWindow::on_scope_row_selected() {
    auto scope = features::handle_scope_selected(
        m_selecting_programmatically,
        m_TreeView,
        m_ScopeColumns.m_col_node_id,
        m_ScopeTree);
    if (!scope) {
        return;
    }

    cancel_pending_edits();
    m_DevicesController.select_scope(*scope);
    schedule_views_update();
}

void LightingWindow::on_scope_activated(const ScopeRef& scope) {
    cancel_pending_edits();
    m_DevicesController.select_scope(scope);
    update_scope_views();
}

void LightingWindow::on_effect_chosen(const std::optional<std::string>& effect_id) {
    const auto& scope = m_DevicesController.selected_scope();
    if (!scope) {
        return;
    }

    // Pending edits target the effect being replaced.
    m_ParamsInvoker.cancel();
    m_PendingParams.reset();
    m_DevicesController.set_scope_effect(*scope, effect_id);
    refresh_scope_states();
    show_controller_status();
    schedule_views_update();
}

void LightingWindow::on_brightness_changed(int value) {
    const auto& scope = m_DevicesController.selected_scope();
    if (!scope) {
        return;
    }
    m_BrightnessInvoker.request(BrightnessRequest{*scope, value});
}

void LightingWindow::send_brightness(const BrightnessRequest& request) {
    m_DevicesController.set_scope_brightness(request.scope, request.value);
    show_controller_status();
}

void LightingWindow::on_param_changed(const std::string& key, const EffectParamValue& value) {
    const auto& scope = m_DevicesController.selected_scope();
    if (!scope) {
        return;
    }
    if (!m_PendingParams || m_PendingParams->scope != *scope) {
        m_PendingParams = ParamsRequest{*scope, EffectParams()};
    }
    m_PendingParams->params[key] = value;
    m_ParamsInvoker.request(*m_PendingParams);
}

void LightingWindow::send_params(const ParamsRequest& request) {
    m_PendingParams.reset();
    m_DevicesController.update_scope_effect_params(request.scope, request.params);
    show_controller_status();
}

void LightingWindow::cancel_pending_edits() {
    m_BrightnessInvoker.cancel();
    m_ParamsInvoker.cancel();
    m_PendingParams.reset();
}

void LightingWindow::on_led_frame(const std::vector<LedColor>& colors) {
    m_Visualizer->set_colors(colors);
}

void LightingWindow::on_stream_state(bool listening) {
    if (!listening) {
        set_status_message("Live LED preview unavailable", true);
    }
}
