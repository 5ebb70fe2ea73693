#ifndef NKCHUNKMAC_FFI_HPP
#define NKCHUNKMAC_FFI_HPP

#include <stdint.h>

#ifdef __cplusplus
extern "C" {
#endif

/**
 * @brief 処理済みバイト数を通知するコールバック。チャンクごとに呼ばれます。
 */
typedef void (*chunkmac_progress_cb)(uint64_t bytes_done, uint64_t total_bytes, void* userdata);

/**
 * @brief JSON設定文字列に基づいてチャンクMAC操作を実行します。
 *
 * @param json_config_str 操作の設定を含むJSON文字列。
 *                        例:
 *                        {
 *                          "operation": "decrypt",
 *                          "input_file": "file.enc",
 *                          "output_file": "file.bin",
 *                          "key": "a18d6d2c543e8782249eeba637ebce2b",
 *                          "iv": "b6a231ecae7c1d640000000000000000",
 *                          "expected_tag": "b1eaa2b0e0317e2f"
 *                        }
 * @param progress NULL可。
 * @param userdata progress にそのまま渡されます。
 * @return 0 成功。非ゼロ: エラーコード。
 *         1: JSONパースエラー
 *         2: JSONデータから設定へのマッピングエラー
 *         3: 不正な引数による構成エラー (例: 無効な操作名、operation の指定なし)
 *         4: 実行エラー
 *         5: 入力ストリームが途中で終了した (StreamTruncated)
 *         6: MACが一致しない (IntegrityMismatch)
 */
int run_chunkmac_op_json(const char* json_config_str, chunkmac_progress_cb progress, void* userdata);

#ifdef __cplusplus
}
#endif

#endif // NKCHUNKMAC_FFI_HPP
