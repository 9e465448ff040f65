/* Ticket: 0008_c_abi_boundary */

#ifndef TIRE_CAPI_H
#define TIRE_CAPI_H

/**
 * @file tire_capi.h
 * @brief C entry points for the tire contact-patch core.
 * @details Every record is a flat struct of single-precision floats with a
 *          stable field order. Functions are stateless and thread-safe; the
 *          caller owns all buffers and all per-tick state. Null or
 *          zero-length inputs return all-zero records instead of failing.
 */

#include <stddef.h>

#if defined(_WIN32)
#define TIRE_CAPI_EXPORT __declspec(dllexport)
#else
#define TIRE_CAPI_EXPORT __attribute__((visibility("default")))
#endif

#ifdef __cplusplus
extern "C"
{
#endif

  typedef enum tire_status_t
  {
    TIRE_STATUS_OK = 0,
    TIRE_STATUS_NULL_ARGUMENT = 1,
    TIRE_STATUS_OUT_OF_MEMORY = 2
  } tire_status_t;

  typedef struct tire_vec3_t
  {
    float x;
    float y;
    float z;
  } tire_vec3_t;

  typedef struct tire_conventions_t
  {
    float epsilon;
    float min_stiffness;
    float min_positive_weight;
    float contact_penetration_threshold;
  } tire_conventions_t;

  typedef struct tire_patch_sample_t
  {
    float weight;
    float penetration;
    float slip_x;
    float slip_y;
  } tire_patch_sample_t;

  typedef struct tire_patch_aggregate_t
  {
    float contact_confidence;
    float penetration_avg;
    float penetration_max;
    float slip_x_avg;
    float slip_y_avg;
  } tire_patch_aggregate_t;

  typedef struct tire_contact_aggregate_t
  {
    tire_vec3_t total_force;
    tire_vec3_t total_torque;
    tire_vec3_t average_position;
    float contact_area;
    float max_pressure;
    float weighted_grip;
  } tire_contact_aggregate_t;

  typedef struct tire_wear_thermal_input_t
  {
    float slip_ratio;
    float slip_angle;
    float peak_pressure;
    float total_force_magnitude;
    float current_wear;
    float base_wear_rate;
    float base_heat_generation;
    float cooling_rate;
    float ambient_temperature;
    float surface_temperature;
    float core_temperature;
    float delta_time;
  } tire_wear_thermal_input_t;

  typedef struct tire_wear_thermal_output_t
  {
    float wear;
    float surface_temperature;
    float core_temperature;
  } tire_wear_thermal_output_t;

  /** @brief Baseline conventions (epsilon 1e-6, min stiffness 1e-4, 0, 0). */
  TIRE_CAPI_EXPORT tire_conventions_t tire_default_conventions(void);

  /**
   * @brief Normalize count weights into out (same length).
   * @param conventions Null selects the baseline conventions.
   * @return TIRE_STATUS_NULL_ARGUMENT if weights or out is null while
   *         count > 0; out is left untouched in that case.
   */
  TIRE_CAPI_EXPORT tire_status_t
  tire_normalize_weights(const float* weights,
                         size_t count,
                         const tire_conventions_t* conventions,
                         float* out);

  /**
   * @brief Statistical patch aggregation.
   * @param conventions Null selects the baseline conventions.
   * @return All-zero aggregate for null samples or count == 0.
   */
  TIRE_CAPI_EXPORT tire_patch_aggregate_t
  tire_aggregate_patch(const tire_patch_sample_t* samples,
                       size_t count,
                       const tire_conventions_t* conventions);

  /**
   * @brief Force/torque aggregation over parallel contact arrays.
   * @return All-zero aggregate if any array is null or count == 0.
   */
  TIRE_CAPI_EXPORT tire_contact_aggregate_t
  tire_aggregate_contacts(const tire_vec3_t* points,
                          const tire_vec3_t* normals,
                          const float* forces,
                          const float* grips,
                          size_t count,
                          tire_vec3_t origin,
                          float stiffness);

  /** @param conventions Null selects the baseline conventions. */
  TIRE_CAPI_EXPORT float
  tire_compute_effective_radius(float tire_radius,
                                float min_effective_radius,
                                float vertical_load,
                                float stiffness,
                                const tire_conventions_t* conventions);

  /**
   * @brief One wear/thermal step with the reference model coefficients.
   * @return All-zero output for a null input.
   */
  TIRE_CAPI_EXPORT tire_wear_thermal_output_t
  tire_step_wear_and_temperature(const tire_wear_thermal_input_t* input);

#ifdef __cplusplus
}
#endif

#endif /* TIRE_CAPI_H */
