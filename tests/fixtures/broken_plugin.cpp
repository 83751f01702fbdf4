// 진입 심볼이 없는 모듈. kLoadFailed 경로 테스트용.

extern "C" int path_hole_unrelated_symbol() {
    return 0;
}
