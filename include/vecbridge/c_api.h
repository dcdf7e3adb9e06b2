/*
 * Copyright (C) 2019-2023 Zilliz. All rights reserved.
 *
 * Licensed under the Apache License, Version 2.0 (the "License"); you may not use this file except in compliance
 * with the License. You may obtain a copy of the License at
 *
 * http://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software distributed under the License
 * is distributed on an "AS IS" BASIS, WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express
 * or implied. See the License for the specific language governing permissions and limitations under the License.
 */

#ifndef VECBRIDGE_C_API_H
#define VECBRIDGE_C_API_H

#include <stddef.h>
#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

#ifndef VECBRIDGE_EXPORT
#define VECBRIDGE_EXPORT __attribute__((visibility("default")))
#endif

#define VECBRIDGE_ERROR_MESSAGE_SIZE 256

/* Opaque index handle. Created by vecbridge_create_index or vecbridge_load_index, released by
 * vecbridge_free_index. */
typedef struct vecbridge_index vecbridge_index_t;

typedef enum vecbridge_error_type_t {
    /* [common errors] */
    VECBRIDGE_UNKNOWN_ERROR = 1,
    VECBRIDGE_INTERNAL_ERROR = 2,
    VECBRIDGE_INVALID_ARGUMENT = 3,
    /* [behavior errors] */
    VECBRIDGE_BUILD_TWICE = 4,
    VECBRIDGE_INDEX_NOT_EMPTY = 5,
    VECBRIDGE_UNSUPPORTED_INDEX = 6,
    VECBRIDGE_UNSUPPORTED_INDEX_OPERATION = 7,
    VECBRIDGE_DIMENSION_NOT_EQUAL = 8,
    VECBRIDGE_INDEX_EMPTY = 9,
    /* [runtime errors] */
    VECBRIDGE_NO_ENOUGH_MEMORY = 10,
    VECBRIDGE_READ_ERROR = 11,
    VECBRIDGE_MISSING_FILE = 12,
    VECBRIDGE_INVALID_BINARY = 13,
} vecbridge_error_type_t;

/* Failure record. `type` holds a vecbridge_error_type_t value and `message` is always NUL-terminated.
 * Release with vecbridge_free_error. */
typedef struct vecbridge_error_t {
    int type;
    char message[VECBRIDGE_ERROR_MESSAGE_SIZE];
} vecbridge_error_t;

/*
 * Every function returning vecbridge_error_t* returns NULL on success.
 *
 * Thread safety: build and load are exclusive per index; searches, dumps and the size queries may run
 * concurrently with each other. Calls on one index are serialized internally where required, so a
 * handle may be shared between threads. Freeing a handle while another thread uses it is undefined.
 */

VECBRIDGE_EXPORT const char*
vecbridge_version(void);

/* `in_index_type` is "hnsw" or "flat"; `in_parameters` is a json object, e.g.
 *   {"dtype": "float32", "metric_type": "l2", "dim": 128,
 *    "hnsw": {"max_degree": 16, "ef_construction": 200}} */
VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_create_index(const char* in_index_type, const char* in_parameters, vecbridge_index_t** out_index);

/* Ids rejected item by item (already indexed, repeated in the batch, non-finite vector, zero vector under
 * cosine) are returned in `out_failed_ids`; the rest are indexed. `*out_failed_ids` is NULL when nothing
 * failed, otherwise release it with vecbridge_free_i64_vector. */
VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_build_index(vecbridge_index_t* in_index, size_t in_num_vectors, size_t in_dim, const int64_t* in_ids,
                      const float* in_vectors, int64_t** out_failed_ids, size_t* out_num_failed);

/* Results are ordered nearest first. `*out_ids` and `*out_distances` are NULL when there are no results,
 * otherwise release them with vecbridge_free_i64_vector and vecbridge_free_f32_vector.
 *   hnsw: {"hnsw": {"ef_search": 100, "use_conjugate_graph_search": true}}
 *   flat: {} */
VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_knn_search_index(const vecbridge_index_t* in_index, size_t in_dim, const float* in_query_vector,
                           size_t in_k, const char* in_search_parameters, int64_t** out_ids,
                           float** out_distances, size_t* out_num_results);

/* Writes `in_file_path` and `in_file_path`.meta. */
VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_dump_index(const vecbridge_index_t* in_index, const char* in_file_path);

/* `in_index_type` and `in_parameters` must describe the dumped index. */
VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_load_index(const char* in_file_path, const char* in_index_type, const char* in_parameters,
                     vecbridge_index_t** out_index);

VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_index_dim(const vecbridge_index_t* in_index, size_t* out_dim);

VECBRIDGE_EXPORT vecbridge_error_t*
vecbridge_index_count(const vecbridge_index_t* in_index, size_t* out_count);

/* All release functions accept NULL. */
VECBRIDGE_EXPORT void
vecbridge_free_index(vecbridge_index_t* index);

VECBRIDGE_EXPORT void
vecbridge_free_error(vecbridge_error_t* error);

VECBRIDGE_EXPORT void
vecbridge_free_i64_vector(int64_t* vector);

VECBRIDGE_EXPORT void
vecbridge_free_f32_vector(float* vector);

#ifdef __cplusplus
}  // extern "C"
#endif

#endif  // VECBRIDGE_C_API_H
